#include "runtime/agent/types.hpp"

namespace everos::runtime {

const char* agent_tier_to_string(AgentTier tier) {
    switch (tier) {
        case AgentTier::FOUNDATION:    return "foundation";
        case AgentTier::SENSING:       return "sensing";
        case AgentTier::DECISION:      return "decision";
        case AgentTier::EXECUTION:     return "execution";
        case AgentTier::LEARNING:      return "learning";
        case AgentTier::ORCHESTRATION: return "orchestration";
        case AgentTier::SPECIALIZED:   return "specialized";
        default: return "unknown";
    }
}

std::optional<AgentTier> agent_tier_from_string(const std::string& str) {
    if (str == "foundation")    return AgentTier::FOUNDATION;
    if (str == "sensing")       return AgentTier::SENSING;
    if (str == "decision")      return AgentTier::DECISION;
    if (str == "execution")     return AgentTier::EXECUTION;
    if (str == "learning")      return AgentTier::LEARNING;
    if (str == "orchestration") return AgentTier::ORCHESTRATION;
    if (str == "specialized")   return AgentTier::SPECIALIZED;
    return std::nullopt;
}

const char* agent_status_to_string(AgentStatus status) {
    switch (status) {
        case AgentStatus::IDLE:    return "idle";
        case AgentStatus::RUNNING: return "running";
        case AgentStatus::PAUSED:  return "paused";
        case AgentStatus::ERROR:   return "error";
        case AgentStatus::STOPPED: return "stopped";
        default: return "unknown";
    }
}

nlohmann::json AgentConfig::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["name"] = name;
    j["tier"] = agent_tier_to_string(tier);
    j["description"] = description;
    j["version"] = version;
    j["dependencies"] = dependencies;
    j["enabled"] = enabled;
    j["tickRate"] = tick_rate_ms;
    j["settings"] = settings;
    return j;
}

nlohmann::json AgentStats::to_json() const {
    return {
        {"tickCount", tick_count},
        {"eventsEmitted", events_emitted},
        {"eventsProcessed", events_processed},
        {"errorCount", error_count},
        {"lastError", last_error},
        {"uptimeMs", uptime_ms},
        {"lastTickSeconds", last_tick_seconds}
    };
}

} // namespace everos::runtime

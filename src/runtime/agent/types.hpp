#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace everos::runtime {

// Coarse agent category, used for indexing and queries only
enum class AgentTier {
    FOUNDATION,
    SENSING,
    DECISION,
    EXECUTION,
    LEARNING,
    ORCHESTRATION,
    SPECIALIZED
};

constexpr size_t kAgentTierCount = 7;

const char* agent_tier_to_string(AgentTier tier);
std::optional<AgentTier> agent_tier_from_string(const std::string& str);

// Agent state
enum class AgentStatus {
    IDLE,
    RUNNING,
    PAUSED,
    ERROR,
    STOPPED
};

constexpr size_t kAgentStatusCount = 5;

const char* agent_status_to_string(AgentStatus status);

// Agent configuration
struct AgentConfig {
    std::string id;
    std::string name;
    AgentTier tier = AgentTier::SPECIALIZED;
    std::string description;
    std::string version = "1.0.0";
    std::vector<std::string> dependencies;    // agent ids that must start first
    bool enabled = true;                      // start_all skips disabled agents
    uint32_t tick_rate_ms = 1000;             // 0 = event driven only
    nlohmann::json settings = nlohmann::json::object();

    nlohmann::json to_json() const;
};

// Per-agent counters
struct AgentStats {
    uint64_t tick_count = 0;
    uint64_t events_emitted = 0;
    uint64_t events_processed = 0;
    uint64_t error_count = 0;
    std::string last_error;
    uint64_t uptime_ms = 0;
    double last_tick_seconds = 0.0;

    nlohmann::json to_json() const;
};

} // namespace everos::runtime

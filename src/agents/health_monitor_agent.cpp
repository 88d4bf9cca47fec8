#include "agents/health_monitor_agent.hpp"
#include "agents/clock_agent.hpp"
#include <spdlog/spdlog.h>

namespace everos::agents {

namespace {

runtime::AgentConfig health_config(uint32_t tick_rate_ms) {
    runtime::AgentConfig config;
    config.id = HealthMonitorAgent::kId;
    config.name = "Health Monitor";
    config.tier = runtime::AgentTier::ORCHESTRATION;
    config.description = "Agent error tracking and periodic health reports";
    config.dependencies = {ClockAgent::kId};
    config.tick_rate_ms = tick_rate_ms;
    return config;
}

} // namespace

HealthMonitorAgent::HealthMonitorAgent(kernel::EventBus& bus, const runtime::AgentRegistry& registry,
                                       uint32_t tick_rate_ms)
    : Agent(health_config(tick_rate_ms), bus), registry_(registry) {}

HealthMonitorAgent::~HealthMonitorAgent() {
    stop();
}

void HealthMonitorAgent::on_start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        errors_by_agent_.clear();
    }

    subscribe("agent:error", [this](const kernel::Event& event) {
        std::string agent_id = event.payload.is_object()
            ? event.payload.value("agentId", event.source)
            : event.source;
        std::lock_guard<std::mutex> lock(mutex_);
        errors_by_agent_[agent_id]++;
    });

    subscribe("health:check", [this](const kernel::Event& event) {
        reply(event, report());
    });
}

void HealthMonitorAgent::on_tick() {
    auto health = report();
    if (health["registry"]["byStatus"].value("error", 0) > 0) {
        spdlog::warn("Health: {} agent(s) in error state", health["registry"]["byStatus"]["error"].get<int>());
    }
    emit("health:report", std::move(health));
}

nlohmann::json HealthMonitorAgent::report() {
    nlohmann::json health;
    health["registry"] = registry_.stats().to_json();
    health["bus"] = bus().get_stats().to_json();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        health["errorsByAgent"] = errors_by_agent_;
    }
    health["timestamp"] = kernel::now_ms();
    return health;
}

} // namespace everos::agents

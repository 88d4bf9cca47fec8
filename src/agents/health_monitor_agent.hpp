#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "runtime/agent/agent.hpp"
#include "runtime/agent/registry.hpp"

namespace everos::agents {

// Watches agent:error and periodically publishes health:report with registry
// and bus statistics. Answers health:check requests with the same report.
class HealthMonitorAgent : public runtime::Agent {
public:
    static constexpr const char* kId = "health";

    HealthMonitorAgent(kernel::EventBus& bus, const runtime::AgentRegistry& registry,
                       uint32_t tick_rate_ms = 5000);
    ~HealthMonitorAgent() override;

    nlohmann::json report();

protected:
    void on_start() override;
    void on_tick() override;

private:
    const runtime::AgentRegistry& registry_;
    std::mutex mutex_;
    std::map<std::string, uint64_t> errors_by_agent_;
};

} // namespace everos::agents

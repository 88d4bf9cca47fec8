#pragma once
#include <atomic>
#include <cstdint>
#include "runtime/agent/agent.hpp"

namespace everos::agents {

// Foundation agent other agents depend on for timing.
// Emits clock:tick every tick, clock:second / clock:minute on wall clock
// boundaries, and answers clock:now requests.
class ClockAgent : public runtime::Agent {
public:
    static constexpr const char* kId = "clock";

    explicit ClockAgent(kernel::EventBus& bus, uint32_t tick_rate_ms = 1000);
    ~ClockAgent() override;

    uint64_t ticks() const { return tick_; }

protected:
    void on_start() override;
    void on_tick() override;

private:
    std::atomic<uint64_t> tick_{0};
    int64_t last_second_ = -1;
    int64_t last_minute_ = -1;
};

} // namespace everos::agents

#include "agents/clock_agent.hpp"

namespace everos::agents {

namespace {

runtime::AgentConfig clock_config(uint32_t tick_rate_ms) {
    runtime::AgentConfig config;
    config.id = ClockAgent::kId;
    config.name = "Clock Agent";
    config.tier = runtime::AgentTier::FOUNDATION;
    config.description = "System time and periodic clock events";
    config.tick_rate_ms = tick_rate_ms;
    return config;
}

} // namespace

ClockAgent::ClockAgent(kernel::EventBus& bus, uint32_t tick_rate_ms)
    : Agent(clock_config(tick_rate_ms), bus) {}

ClockAgent::~ClockAgent() {
    stop();
}

void ClockAgent::on_start() {
    tick_ = 0;
    last_second_ = -1;
    last_minute_ = -1;

    subscribe("clock:now", [this](const kernel::Event& event) {
        reply(event, {{"timestamp", kernel::now_ms()}, {"tick", tick_.load()}});
    });
}

void ClockAgent::on_tick() {
    uint64_t tick = ++tick_;
    uint64_t now = kernel::now_ms();

    emit("clock:tick", {{"tick", tick}, {"uptimeMs", stats().uptime_ms}});

    auto second = static_cast<int64_t>(now / 1000);
    if (second != last_second_) {
        last_second_ = second;
        emit("clock:second", {{"epochSeconds", second}});
    }

    auto minute = second / 60;
    if (minute != last_minute_) {
        last_minute_ = minute;
        emit("clock:minute", {{"epochMinutes", minute}});
    }
}

} // namespace everos::agents

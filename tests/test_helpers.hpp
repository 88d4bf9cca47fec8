#pragma once
#include <doctest/doctest.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <string>
#include <thread>
#include <vector>
#include "kernel/event_bus.hpp"
#include "runtime/agent/agent.hpp"

namespace everos::test {

// Poll pred until it holds or timeout expires
inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

// Holds the dispatcher inside a handler so several events can be queued at once
class DispatchGate {
public:
    explicit DispatchGate(kernel::EventBus& bus, std::string topic = "test:gate", int priority = 0)
        : bus_(bus), topic_(std::move(topic)), released_(release_.get_future().share()) {
        kernel::SubscribeOptions options;
        options.priority = priority;
        bus_.subscribe(topic_, [this](const kernel::Event&) {
            entered_ = true;
            released_.wait();
        }, options);
    }

    void close(nlohmann::json payload = nlohmann::json::object()) {
        bus_.emit(topic_, std::move(payload));
        REQUIRE(wait_until([this]() { return entered_.load(); }));
    }

    void open() { release_.set_value(); }

private:
    kernel::EventBus& bus_;
    std::string topic_;
    std::promise<void> release_;
    std::shared_future<void> released_;
    std::atomic<bool> entered_{false};
};

inline runtime::AgentConfig make_config(const std::string& id,
                                        std::vector<std::string> dependencies = {},
                                        uint32_t tick_rate_ms = 0,
                                        runtime::AgentTier tier = runtime::AgentTier::SPECIALIZED) {
    runtime::AgentConfig config;
    config.id = id;
    config.name = id;
    config.tier = tier;
    config.dependencies = std::move(dependencies);
    config.tick_rate_ms = tick_rate_ms;
    return config;
}

// Agent whose hooks are plain std::function members, set before start()
class ScriptedAgent : public runtime::Agent {
public:
    ScriptedAgent(runtime::AgentConfig config, kernel::EventBus& bus)
        : Agent(std::move(config), bus) {}
    ~ScriptedAgent() override { stop(); }

    std::function<void(ScriptedAgent&)> start_hook;
    std::function<void(ScriptedAgent&)> stop_hook;
    std::function<void(ScriptedAgent&)> tick_hook;

    using Agent::emit;
    using Agent::reply;
    using Agent::subscribe;
    using Agent::unsubscribe;

protected:
    void on_start() override {
        if (start_hook) start_hook(*this);
    }
    void on_stop() override {
        if (stop_hook) stop_hook(*this);
    }
    void on_tick() override {
        if (tick_hook) tick_hook(*this);
    }
};

} // namespace everos::test

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/event_bus.hpp"
#include "runtime/agent/types.hpp"

namespace everos::runtime {

// Base class for every agent.
//
// Lifecycle: idle -start-> running -stop-> stopped, running -pause-> paused
// -resume-> running. A throwing on_start/on_tick moves a running agent to
// error; only start() brings it back. Agents with tick_rate_ms > 0 get their
// own tick thread, and a tick never overlaps the previous one.
//
// Owners must call stop() before destroying an agent: the tick thread calls
// virtual hooks. stop() returns once the tick thread has exited and no bus
// handler of this agent is still running, unless it is called from on_tick or
// from one of those handlers; the thread is then joined by the next start(),
// stop() or the destructor.
class Agent {
public:
    Agent(AgentConfig config, kernel::EventBus& bus);
    virtual ~Agent();

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    // No-op while running or paused
    void start();
    // No-op once stopped. Cancels the tick thread and releases subscriptions.
    void stop();
    bool pause();
    bool resume();

    // Run one tick on the calling thread. False when not running, when a tick
    // is already in progress, or when on_tick threw.
    bool tick();

    AgentStatus status() const { return status_.load(); }
    const AgentConfig& config() const { return config_; }
    const std::string& id() const { return config_.id; }
    AgentStats stats() const;

protected:
    virtual void on_start() {}
    virtual void on_stop() {}
    virtual void on_tick() {}

    // Emit with source = this agent's id
    std::string emit(const std::string& type, nlohmann::json payload = nlohmann::json::object(),
                     kernel::EmitOptions options = kernel::EmitOptions{});

    // Answer a request event on its reply topic; false if it expects no reply
    bool reply(const kernel::Event& request, nlohmann::json payload);

    // Subscription released automatically on stop()
    kernel::SubscriptionId subscribe(const std::string& pattern, kernel::EventHandler handler,
                                     kernel::SubscribeOptions options = kernel::SubscribeOptions{});
    bool unsubscribe(kernel::SubscriptionId id);

    kernel::EventBus& bus() { return bus_; }

private:
    void fail(const std::string& phase, const std::string& message);
    void record_error(const std::string& phase, const std::string& message);
    void launch_ticker();
    std::thread take_ticker();
    void join_ticker(std::thread ticker);
    void reap_retired_ticker();
    void tick_loop(uint64_t generation);
    void release_subscriptions();

    const AgentConfig config_;
    kernel::EventBus& bus_;
    std::atomic<AgentStatus> status_{AgentStatus::IDLE};
    std::mutex lifecycle_mutex_;

    // Tick thread; ticker_ is only touched under lifecycle_mutex_
    std::thread ticker_;
    std::mutex retired_mutex_;
    std::thread retired_ticker_;    // stopped from inside its own tick
    std::mutex tick_mutex_;
    std::condition_variable tick_cv_;
    uint64_t ticker_generation_ = 0;
    bool ticker_stop_ = false;
    std::mutex tick_run_mutex_;

    std::mutex subscriptions_mutex_;
    std::vector<kernel::SubscriptionId> subscriptions_;

    mutable std::mutex stats_mutex_;
    AgentStats stats_;
    std::chrono::steady_clock::time_point started_at_;
};

} // namespace everos::runtime

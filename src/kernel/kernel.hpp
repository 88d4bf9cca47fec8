/**
 * everos Kernel
 *
 * Process-wide context handed to agents and collaborators at startup:
 * - EventBus (publish/subscribe, dead letters, request/reply)
 * - AgentRegistry (dependency-ordered agent lifecycle)
 * - world:tick heartbeat while running
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include "kernel/config.hpp"
#include "kernel/event_bus.hpp"
#include "runtime/agent/registry.hpp"

namespace everos::kernel {

class Kernel {
public:
    using Config = KernelConfig;

    Kernel();
    explicit Kernel(const Config& config);
    ~Kernel();

    // Non-copyable
    Kernel(const Kernel&) = delete;
    Kernel& operator=(const Kernel&) = delete;

    // Start all agents and run the world tick loop (blocks until stopped),
    // then stop all agents and drain the bus
    void run();

    // Request shutdown and wake run()
    void shutdown();

    // Async-signal-safe variant of shutdown(); run() notices within one slice
    void request_stop() noexcept;

    bool is_running() const { return running_; }
    uint64_t world_tick() const { return world_tick_; }

    EventBus& bus() { return *bus_; }
    runtime::AgentRegistry& agents() { return *registry_; }

    const Config& get_config() const { return config_; }

private:
    void emit_world_tick();

    Config config_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<uint64_t> world_tick_{0};

    std::mutex run_mutex_;
    std::condition_variable run_cv_;

    // Declaration order matters: the registry unsubscribes from the bus on destruction
    std::unique_ptr<EventBus> bus_;
    std::unique_ptr<runtime::AgentRegistry> registry_;
};

} // namespace everos::kernel

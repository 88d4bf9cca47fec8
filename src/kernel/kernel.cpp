#include "kernel/kernel.hpp"
#include <algorithm>
#include <chrono>
#include <spdlog/spdlog.h>

namespace everos::kernel {

namespace {

// Upper bound on how long run() takes to notice request_stop()
constexpr std::chrono::milliseconds kStopPollSlice{50};

} // namespace

Kernel::Kernel() : Kernel(Config{}) {}

Kernel::Kernel(const Config& config)
    : config_(config),
      bus_(std::make_unique<EventBus>(config.bus)),
      registry_(std::make_unique<runtime::AgentRegistry>(*bus_)) {
    spdlog::debug("Kernel initialized (world_tick={}ms)", config_.world_tick_ms);
}

Kernel::~Kernel() {
    shutdown();
    // Agents may still be running if run() was never called
    registry_->stop_all();
    if (!bus_->flush()) {
        spdlog::warn("Event bus did not drain before the registry was released");
    }
    registry_.reset();
    bus_->shutdown();
}

void Kernel::run() {
    if (running_.exchange(true)) {
        spdlog::warn("Kernel is already running");
        return;
    }
    stop_requested_ = false;

    spdlog::info("Kernel starting ({} agent(s) registered)", registry_->count());
    registry_->start_all();
    bus_->emit("system:started", {{"agents", registry_->count()}});

    const auto tick_period = std::chrono::milliseconds(config_.world_tick_ms);
    auto next_tick = std::chrono::steady_clock::now() + tick_period;

    while (!stop_requested_) {
        auto slice = kStopPollSlice;
        if (config_.world_tick_ms > 0) {
            auto until_tick = std::chrono::duration_cast<std::chrono::milliseconds>(
                next_tick - std::chrono::steady_clock::now());
            slice = std::clamp(until_tick, std::chrono::milliseconds(0), kStopPollSlice);
        }

        {
            std::unique_lock<std::mutex> lock(run_mutex_);
            run_cv_.wait_for(lock, slice, [this]() { return stop_requested_.load(); });
        }
        if (stop_requested_) {
            break;
        }

        if (config_.world_tick_ms > 0 && std::chrono::steady_clock::now() >= next_tick) {
            emit_world_tick();
            next_tick += tick_period;
        }
    }

    spdlog::info("Kernel shutting down...");
    bus_->emit("system:shutdown", {{"worldTick", world_tick_.load()}});
    registry_->stop_all();
    if (!bus_->flush()) {
        spdlog::warn("Event bus did not drain before shutdown");
    }

    running_ = false;
    spdlog::info("Kernel stopped");
}

void Kernel::shutdown() {
    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        stop_requested_ = true;
    }
    run_cv_.notify_all();
}

void Kernel::request_stop() noexcept {
    stop_requested_ = true;
}

void Kernel::emit_world_tick() {
    uint64_t tick = ++world_tick_;
    EmitOptions options;
    options.source = "kernel";
    options.priority = EventPriority::LOW;
    bus_->emit("world:tick", {{"tick", tick}}, options);
}

} // namespace everos::kernel

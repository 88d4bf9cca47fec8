#include "runtime/agent/agent.hpp"
#include <algorithm>
#include <initializer_list>
#include <spdlog/spdlog.h>

namespace everos::runtime {

namespace {

constexpr const char* kAgentErrorTopic = "agent:error";

} // namespace

Agent::Agent(AgentConfig config, kernel::EventBus& bus)
    : config_(std::move(config)), bus_(bus) {}

Agent::~Agent() {
    std::thread ticker;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        ticker = take_ticker();
    }
    std::thread retired;
    {
        std::lock_guard<std::mutex> lock(retired_mutex_);
        retired = std::move(retired_ticker_);
    }

    for (auto* thread : {&ticker, &retired}) {
        if (!thread->joinable()) continue;
        if (thread->get_id() == std::this_thread::get_id()) {
            // Last reference dropped inside on_tick; the loop exits on return
            thread->detach();
        } else {
            thread->join();
        }
    }

    release_subscriptions();
    bus_.wait_for_handlers();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void Agent::start() {
    std::thread leftover;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        AgentStatus current = status_.load();
        if (current == AgentStatus::RUNNING || current == AgentStatus::PAUSED) {
            return;
        }
        // Leftovers of a run that ended in error
        leftover = take_ticker();
    }
    join_ticker(std::move(leftover));
    reap_retired_ticker();

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    AgentStatus current = status_.load();
    if (current == AgentStatus::RUNNING || current == AgentStatus::PAUSED) {
        return;
    }
    release_subscriptions();

    status_ = AgentStatus::RUNNING;
    {
        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        started_at_ = std::chrono::steady_clock::now();
    }

    try {
        on_start();
    } catch (const std::exception& e) {
        fail("start", e.what());
        return;
    } catch (...) {
        fail("start", "unknown exception");
        return;
    }

    if (config_.tick_rate_ms > 0) {
        launch_ticker();
    }

    spdlog::info("Agent {} started (tier={}, tick={}ms)",
        config_.id, agent_tier_to_string(config_.tier), config_.tick_rate_ms);
    emit("agent:started", {{"agentId", config_.id}});
}

void Agent::stop() {
    AgentStatus previous;
    std::thread ticker;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        previous = status_.exchange(AgentStatus::STOPPED);
        ticker = take_ticker();
        if (previous != AgentStatus::STOPPED) {
            release_subscriptions();
        }
    }

    // Outside the lifecycle lock: on_tick and handlers may call pause()/resume()
    join_ticker(std::move(ticker));
    reap_retired_ticker();
    bus_.wait_for_handlers();

    if (previous == AgentStatus::STOPPED) {
        return;
    }

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (status_.load() != AgentStatus::STOPPED) {
        // restarted while the tick thread was being joined
        return;
    }

    if (previous != AgentStatus::IDLE) {
        try {
            on_stop();
        } catch (const std::exception& e) {
            record_error("stop", e.what());
        } catch (...) {
            record_error("stop", "unknown exception");
        }
    }

    spdlog::info("Agent {} stopped", config_.id);
    emit("agent:stopped", {{"agentId", config_.id}});
}

bool Agent::pause() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    AgentStatus expected = AgentStatus::RUNNING;
    if (!status_.compare_exchange_strong(expected, AgentStatus::PAUSED)) {
        return false;
    }
    spdlog::debug("Agent {} paused", config_.id);
    emit("agent:paused", {{"agentId", config_.id}});
    return true;
}

bool Agent::resume() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    AgentStatus expected = AgentStatus::PAUSED;
    if (!status_.compare_exchange_strong(expected, AgentStatus::RUNNING)) {
        return false;
    }
    spdlog::debug("Agent {} resumed", config_.id);
    emit("agent:resumed", {{"agentId", config_.id}});
    return true;
}

// ---------------------------------------------------------------------------
// Ticks
// ---------------------------------------------------------------------------

bool Agent::tick() {
    std::unique_lock<std::mutex> running(tick_run_mutex_, std::try_to_lock);
    if (!running.owns_lock()) {
        spdlog::debug("Agent {} tick skipped, previous tick still running", config_.id);
        return false;
    }
    if (status_.load() != AgentStatus::RUNNING) {
        return false;
    }

    auto begin = std::chrono::steady_clock::now();
    bool ok = true;
    try {
        on_tick();
    } catch (const std::exception& e) {
        fail("tick", e.what());
        ok = false;
    } catch (...) {
        fail("tick", "unknown exception");
        ok = false;
    }

    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - begin;
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.last_tick_seconds = elapsed.count();
    if (ok) {
        ++stats_.tick_count;
    }
    return ok;
}

void Agent::launch_ticker() {
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(tick_mutex_);
        ticker_stop_ = false;
        generation = ++ticker_generation_;
    }
    ticker_ = std::thread([this, generation]() { tick_loop(generation); });
}

std::thread Agent::take_ticker() {
    {
        std::lock_guard<std::mutex> lock(tick_mutex_);
        ticker_stop_ = true;
    }
    tick_cv_.notify_all();
    return std::move(ticker_);
}

void Agent::join_ticker(std::thread ticker) {
    if (!ticker.joinable()) {
        return;
    }
    if (ticker.get_id() != std::this_thread::get_id()) {
        ticker.join();
        return;
    }

    // stop() from inside on_tick: the loop exits as soon as the tick returns
    std::lock_guard<std::mutex> lock(retired_mutex_);
    if (retired_ticker_.joinable()) {
        retired_ticker_.join();
    }
    retired_ticker_ = std::move(ticker);
}

void Agent::reap_retired_ticker() {
    std::thread retired;
    {
        std::lock_guard<std::mutex> lock(retired_mutex_);
        if (!retired_ticker_.joinable() ||
            retired_ticker_.get_id() == std::this_thread::get_id()) {
            return;
        }
        retired = std::move(retired_ticker_);
    }
    retired.join();
}

void Agent::tick_loop(uint64_t generation) {
    const auto period = std::chrono::milliseconds(config_.tick_rate_ms);
    std::unique_lock<std::mutex> lock(tick_mutex_);
    auto halted = [this, generation]() {
        return ticker_stop_ || ticker_generation_ != generation;
    };

    // The next period starts only after the previous tick returned
    while (!tick_cv_.wait_for(lock, period, halted)) {
        lock.unlock();
        tick();
        lock.lock();
    }
}

// ---------------------------------------------------------------------------
// Bus helpers
// ---------------------------------------------------------------------------

std::string Agent::emit(const std::string& type, nlohmann::json payload, kernel::EmitOptions options) {
    options.source = config_.id;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.events_emitted;
    }
    return bus_.emit(type, std::move(payload), options);
}

bool Agent::reply(const kernel::Event& request, nlohmann::json payload) {
    if (!request.reply_to) {
        return false;
    }
    kernel::EmitOptions options;
    options.correlation_id = request.correlation_id;
    options.target = request.source;
    emit(*request.reply_to, std::move(payload), options);
    return true;
}

kernel::SubscriptionId Agent::subscribe(const std::string& pattern, kernel::EventHandler handler,
                                        kernel::SubscribeOptions options) {
    auto wrapped = [this, handler = std::move(handler)](const kernel::Event& event) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            ++stats_.events_processed;
        }
        try {
            handler(event);
        } catch (const std::exception& e) {
            if (event.type != kAgentErrorTopic) {
                record_error("event", e.what());
            }
            throw;  // the bus dead-letters it
        }
    };

    auto id = bus_.subscribe(pattern, std::move(wrapped), std::move(options));
    std::lock_guard<std::mutex> lock(subscriptions_mutex_);
    subscriptions_.push_back(id);
    return id;
}

bool Agent::unsubscribe(kernel::SubscriptionId id) {
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        subscriptions_.erase(std::remove(subscriptions_.begin(), subscriptions_.end(), id),
                             subscriptions_.end());
    }
    return bus_.unsubscribe(id);
}

void Agent::release_subscriptions() {
    std::vector<kernel::SubscriptionId> ids;
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        ids.swap(subscriptions_);
    }
    for (auto id : ids) {
        bus_.unsubscribe(id);
    }
}

// ---------------------------------------------------------------------------
// Errors & stats
// ---------------------------------------------------------------------------

void Agent::fail(const std::string& phase, const std::string& message) {
    AgentStatus expected = AgentStatus::RUNNING;
    status_.compare_exchange_strong(expected, AgentStatus::ERROR);
    record_error(phase, message);
}

void Agent::record_error(const std::string& phase, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.error_count;
        stats_.last_error = message;
    }

    spdlog::error("Agent {} {} failed: {}", config_.id, phase, message);

    kernel::EmitOptions options;
    options.priority = kernel::EventPriority::HIGH;
    emit(kAgentErrorTopic, {
        {"agentId", config_.id},
        {"phase", phase},
        {"error", message},
        {"status", agent_status_to_string(status_.load())}
    }, options);
}

AgentStats Agent::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    AgentStats snapshot = stats_;
    AgentStatus current = status_.load();
    if (current == AgentStatus::RUNNING || current == AgentStatus::PAUSED) {
        snapshot.uptime_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at_).count());
    }
    return snapshot;
}

} // namespace everos::runtime

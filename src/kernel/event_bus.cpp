#include "kernel/event_bus.hpp"
#include <algorithm>
#include <future>
#include <iterator>
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace everos::kernel {

RequestTimeout::RequestTimeout(const std::string& type, std::chrono::milliseconds timeout)
    : std::runtime_error(fmt::format("Request timeout: {} ({}ms)", type, timeout.count())),
      request_type_(type),
      timeout_(timeout) {}

bool SubscriptionToken::unsubscribe() const {
    return bus_ != nullptr && bus_->unsubscribe(id_);
}

nlohmann::json BusStats::to_json() const {
    nlohmann::json j;
    j["subscriptions"] = subscriptions;
    j["queueSize"] = queue_size;
    j["deadLetters"] = dead_letters;
    j["historySize"] = history_size;
    j["eventsEmitted"] = events_emitted;
    j["eventsDispatched"] = events_dispatched;
    j["handlerFailures"] = handler_failures;
    return j;
}

EventBus::EventBus(const BusConfig& config)
    : config_(config),
      dead_letters_(config.max_dead_letters, config.max_retries) {
    dispatcher_ = std::thread([this]() { dispatch_loop(); });
    spdlog::debug("EventBus initialized (max_history={}, max_dead_letters={}, max_retries={})",
        config_.max_history, config_.max_dead_letters, config_.max_retries);
}

EventBus::~EventBus() {
    shutdown();
}

// ---------------------------------------------------------------------------
// Publishing
// ---------------------------------------------------------------------------

std::string EventBus::emit(const std::string& type, nlohmann::json payload, const EmitOptions& options) {
    Event event;
    event.id = generate_id();
    event.type = type;
    event.payload = std::move(payload);
    event.source = options.source.empty() ? "system" : options.source;
    event.target = options.target;
    event.priority = options.priority;
    event.timestamp_ms = now_ms();
    event.correlation_id = options.correlation_id;
    event.reply_to = options.reply_to;
    event.metadata = options.metadata;

    std::string id = event.id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            spdlog::warn("Event {} emitted on a stopping bus, it may never be delivered", type);
        }
        record_history(event);
        queue_.enqueue(std::move(event), options.priority);
        ++events_emitted_;
    }
    queue_cv_.notify_one();

    spdlog::trace("Event {} ({}) queued", type, id);
    return id;
}

nlohmann::json EventBus::request(const std::string& type, nlohmann::json payload,
                                 std::chrono::milliseconds timeout, EmitOptions options) {
    if (on_dispatch_thread()) {
        throw std::logic_error("EventBus::request called from a bus handler: " + type);
    }

    const std::string correlation_id = generate_id();
    const std::string reply_type = type + ":reply:" + correlation_id;

    auto reply = std::make_shared<std::promise<nlohmann::json>>();
    auto future = reply->get_future();

    once(reply_type, [reply](const Event& event) {
        reply->set_value(event.payload);
    });

    options.correlation_id = correlation_id;
    options.reply_to = reply_type;
    emit(type, std::move(payload), options);

    bool answered = future.wait_for(timeout) == std::future_status::ready;
    // Reply topics are single use; drop the pattern entry as well
    unsubscribe(reply_type);
    if (!answered) {
        spdlog::warn("Request {} timed out after {}ms", type, timeout.count());
        throw RequestTimeout(type, timeout);
    }
    return future.get();
}

nlohmann::json EventBus::request(const std::string& type, nlohmann::json payload) {
    return request(type, std::move(payload), config_.default_request_timeout);
}

// ---------------------------------------------------------------------------
// Subscribing
// ---------------------------------------------------------------------------

SubscriptionToken EventBus::subscribe(const std::string& pattern, EventHandler handler,
                                      SubscribeOptions options) {
    SubscriptionId id = next_subscription_id_.fetch_add(1, std::memory_order_relaxed);
    Subscription sub{id, std::move(handler), std::move(options.filter), options.priority, options.once};

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(patterns_.begin(), patterns_.end(),
        [&](const PatternEntry& e) { return e.compiled.pattern() == pattern; });
    if (it == patterns_.end()) {
        patterns_.push_back(PatternEntry{EventPattern::compile(pattern), {}});
        it = std::prev(patterns_.end());
    }
    it->subscriptions.push_back(std::move(sub));

    spdlog::debug("Subscription {} added for '{}'{}", id, pattern, options.once ? " (once)" : "");
    return SubscriptionToken(this, id);
}

SubscriptionToken EventBus::once(const std::string& pattern, EventHandler handler) {
    SubscribeOptions options;
    options.once = true;
    return subscribe(pattern, std::move(handler), std::move(options));
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : patterns_) {
        auto& subs = entry.subscriptions;
        auto it = std::find_if(subs.begin(), subs.end(),
            [id](const Subscription& s) { return s.id == id; });
        if (it != subs.end()) {
            subs.erase(it);
            return true;
        }
    }
    return false;
}

size_t EventBus::unsubscribe(const std::string& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(patterns_.begin(), patterns_.end(),
        [&](const PatternEntry& e) { return e.compiled.pattern() == pattern; });
    if (it == patterns_.end()) {
        return 0;
    }
    size_t removed = it->subscriptions.size();
    patterns_.erase(it);
    spdlog::debug("Removed {} subscription(s) for '{}'", removed, pattern);
    return removed;
}

bool EventBus::unsubscribe(const std::string& pattern, SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entry = std::find_if(patterns_.begin(), patterns_.end(),
        [&](const PatternEntry& e) { return e.compiled.pattern() == pattern; });
    if (entry == patterns_.end()) {
        return false;
    }

    auto& subs = entry->subscriptions;
    auto it = std::find_if(subs.begin(), subs.end(),
        [id](const Subscription& s) { return s.id == id; });
    if (it == subs.end()) {
        return false;
    }
    subs.erase(it);
    return true;
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

void EventBus::dispatch_loop() {
    while (true) {
        Event event;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });

            // Re-checked after every event, so anything emitted mid-dispatch is picked up
            auto next = queue_.dequeue();
            if (!next) {
                idle_cv_.notify_all();
                return;
            }
            event = std::move(*next);
            dispatching_ = true;
        }

        dispatch(event);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            dispatching_ = false;
            ++events_dispatched_;
        }
        // Wakes flush() and wait_for_handlers()
        idle_cv_.notify_all();
    }
}

void EventBus::dispatch(const Event& event) {
    auto handlers = matching_subscriptions(event.type);
    if (handlers.empty()) {
        spdlog::trace("Event {} ({}) has no subscribers", event.type, event.id);
        return;
    }

    for (const auto& sub : handlers) {
        try {
            if (sub.filter && !sub.filter(event)) {
                continue;
            }
            sub.handler(event);
            if (sub.once) {
                unsubscribe(sub.id);
            }
        } catch (const std::exception& e) {
            record_failure(event, e.what());
        } catch (...) {
            record_failure(event, "unknown exception");
        }
    }
}

std::vector<EventBus::Subscription> EventBus::matching_subscriptions(const std::string& event_type) const {
    std::vector<Subscription> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : patterns_) {
            if (entry.compiled.matches(event_type)) {
                handlers.insert(handlers.end(), entry.subscriptions.begin(), entry.subscriptions.end());
            }
        }
    }

    std::stable_sort(handlers.begin(), handlers.end(),
        [](const Subscription& a, const Subscription& b) { return a.priority > b.priority; });
    return handlers;
}

void EventBus::record_failure(const Event& event, const std::string& error) {
    uint32_t retry_count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dead_letters_.add(event, error);
        ++handler_failures_;
        if (auto letter = dead_letters_.get(event.id)) {
            retry_count = letter->retry_count;
        }
    }

    spdlog::warn("Handler for {} (event {}) failed: {}", event.type, event.id, error);

    // A failing dead-letter listener must not feed itself
    if (config_.emit_dead_letter_events && event.type != kDeadLetterTopic) {
        EmitOptions options;
        options.source = "event_bus";
        options.priority = EventPriority::HIGH;
        emit(kDeadLetterTopic, {
            {"eventId", event.id},
            {"type", event.type},
            {"error", error},
            {"retryCount", retry_count}
        }, options);
    }
}

// ---------------------------------------------------------------------------
// History & dead letters
// ---------------------------------------------------------------------------

void EventBus::record_history(const Event& event) {
    history_.push_back(event);
    if (history_.size() > config_.max_history) {
        size_t keep = config_.max_history / 2;
        history_.erase(history_.begin(), history_.end() - static_cast<std::ptrdiff_t>(keep));
    }
}

std::vector<Event> EventBus::get_history(const HistoryFilter& filter) const {
    std::vector<Event> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events.assign(history_.begin(), history_.end());
    }

    if (filter.type) {
        auto pattern = EventPattern::compile(*filter.type);
        events.erase(std::remove_if(events.begin(), events.end(),
            [&](const Event& e) { return !pattern.matches(e.type); }), events.end());
    }
    if (filter.source) {
        events.erase(std::remove_if(events.begin(), events.end(),
            [&](const Event& e) { return e.source != *filter.source; }), events.end());
    }
    if (filter.since_ms) {
        events.erase(std::remove_if(events.begin(), events.end(),
            [&](const Event& e) { return e.timestamp_ms < *filter.since_ms; }), events.end());
    }
    if (filter.limit > 0 && events.size() > filter.limit) {
        events.erase(events.begin(), events.end() - static_cast<std::ptrdiff_t>(filter.limit));
    }
    return events;
}

std::vector<DeadLetter> EventBus::get_dead_letters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dead_letters_.get_all();
}

std::optional<DeadLetter> EventBus::get_dead_letter(const std::string& event_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dead_letters_.get(event_id);
}

bool EventBus::retry_dead_letter(const std::string& event_id) {
    bool accepted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        accepted = dead_letters_.retry(event_id, [this](const Event& event) {
            queue_.enqueue(event, event.priority);
        });
    }

    if (!accepted) {
        spdlog::debug("Dead letter {} not retried (unknown or retries exhausted)", event_id);
        return false;
    }

    queue_cv_.notify_one();
    spdlog::info("Dead letter {} requeued", event_id);
    return true;
}

void EventBus::clear_dead_letters() {
    std::lock_guard<std::mutex> lock(mutex_);
    dead_letters_.clear();
}

BusStats EventBus::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    BusStats stats;
    for (const auto& entry : patterns_) {
        stats.subscriptions += entry.subscriptions.size();
    }
    stats.queue_size = queue_.size();
    stats.dead_letters = dead_letters_.size();
    stats.history_size = history_.size();
    stats.events_emitted = events_emitted_;
    stats.events_dispatched = events_dispatched_;
    stats.handler_failures = handler_failures_;
    return stats;
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void EventBus::wait_for_handlers() {
    if (on_dispatch_thread()) {
        return;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    const uint64_t in_flight = events_dispatched_;
    idle_cv_.wait(lock, [this, in_flight]() {
        return !dispatching_ || events_dispatched_ != in_flight;
    });
}

bool EventBus::flush(std::chrono::milliseconds timeout) {
    if (on_dispatch_thread()) {
        return false;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() {
        return queue_.empty() && !dispatching_;
    });
}

void EventBus::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();

    if (dispatcher_.joinable() && !on_dispatch_thread()) {
        dispatcher_.join();
        spdlog::debug("EventBus dispatcher stopped");
    }
}

bool EventBus::on_dispatch_thread() const {
    return std::this_thread::get_id() == dispatcher_.get_id();
}

std::string EventBus::generate_id() {
    return fmt::format("evt_{}_{}", now_ms(), next_event_seq_.fetch_add(1, std::memory_order_relaxed));
}

} // namespace everos::kernel

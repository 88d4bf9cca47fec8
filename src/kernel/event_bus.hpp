/**
 * everos Event Bus
 *
 * In-process publish/subscribe hub shared by every agent:
 * - Priority queue drained by one dedicated dispatcher thread
 * - Exact / prefix / suffix / match-all subscription patterns
 * - Dead-letter capture and bounded retry for failing handlers
 * - Request/reply over generated one-shot reply topics
 * - Bounded event history
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/config.hpp"
#include "kernel/dead_letter_store.hpp"
#include "kernel/event.hpp"
#include "kernel/event_pattern.hpp"
#include "kernel/priority_queue.hpp"

namespace everos::kernel {

// Published when a handler throws (unless disabled in BusConfig).
// Match-all ("*") and "system:*" subscribers receive these notices too.
inline constexpr const char* kDeadLetterTopic = "system:dead_letter";

class EventBus;

// Returned by subscribe()/once(). Calling it removes the subscription; letting
// it go out of scope does not. Converts to the plain SubscriptionId.
class SubscriptionToken {
public:
    SubscriptionToken() = default;
    SubscriptionToken(EventBus* bus, SubscriptionId id) : bus_(bus), id_(id) {}

    SubscriptionId id() const { return id_; }
    operator SubscriptionId() const { return id_; }

    // False if already removed
    bool unsubscribe() const;
    bool operator()() const { return unsubscribe(); }

private:
    EventBus* bus_ = nullptr;
    SubscriptionId id_ = 0;
};

// Thrown by EventBus::request when no reply arrives in time
class RequestTimeout : public std::runtime_error {
public:
    RequestTimeout(const std::string& type, std::chrono::milliseconds timeout);

    const std::string& request_type() const { return request_type_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::string request_type_;
    std::chrono::milliseconds timeout_;
};

struct HistoryFilter {
    std::optional<std::string> type;        // subscription pattern syntax
    std::optional<std::string> source;
    std::optional<uint64_t> since_ms;
    size_t limit = 0;                       // 0 = no limit, otherwise newest N
};

struct BusStats {
    size_t subscriptions = 0;
    size_t queue_size = 0;
    size_t dead_letters = 0;
    size_t history_size = 0;
    uint64_t events_emitted = 0;
    uint64_t events_dispatched = 0;
    uint64_t handler_failures = 0;

    nlohmann::json to_json() const;
};

class EventBus {
public:
    explicit EventBus(const BusConfig& config = BusConfig{});
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // Queue an event and return its id. Delivery happens on the dispatcher thread.
    std::string emit(const std::string& type, nlohmann::json payload = nlohmann::json::object(),
                     const EmitOptions& options = EmitOptions{});

    // Emit with correlation_id/reply_to set and block until a reply is emitted
    // to the reply topic. Throws RequestTimeout; throws std::logic_error when
    // called from a handler, since the dispatcher could never deliver the reply.
    nlohmann::json request(const std::string& type, nlohmann::json payload,
                           std::chrono::milliseconds timeout, EmitOptions options = EmitOptions{});
    nlohmann::json request(const std::string& type, nlohmann::json payload = nlohmann::json::object());

    // A pattern keeps its dispatch position for the life of the bus, even
    // while it has no handlers, until unsubscribe(pattern) drops it.
    // "*" subscribers also see system:dead_letter notices.
    SubscriptionToken subscribe(const std::string& pattern, EventHandler handler,
                                SubscribeOptions options = SubscribeOptions{});
    SubscriptionToken once(const std::string& pattern, EventHandler handler);

    bool unsubscribe(SubscriptionId id);
    // Remove every handler registered under pattern, and the pattern's
    // position; returns how many handlers were removed
    size_t unsubscribe(const std::string& pattern);
    bool unsubscribe(const std::string& pattern, SubscriptionId id);

    // Block until the event being dispatched right now, if any, has reached
    // all of its handlers. Handlers run on copies taken before dispatch, so
    // call this after unsubscribing and before destroying what a handler
    // captured. Returns at once on the dispatcher thread.
    void wait_for_handlers();

    std::vector<Event> get_history(const HistoryFilter& filter = HistoryFilter{}) const;
    std::vector<DeadLetter> get_dead_letters() const;
    std::optional<DeadLetter> get_dead_letter(const std::string& event_id) const;
    bool retry_dead_letter(const std::string& event_id);
    void clear_dead_letters();
    BusStats get_stats() const;

    // Wait until the queue is empty and nothing is being dispatched.
    // Returns false on timeout, or at once when called from a handler.
    bool flush(std::chrono::milliseconds timeout = std::chrono::seconds(5));

    // Deliver what is queued, then stop the dispatcher thread
    void shutdown();

    bool on_dispatch_thread() const;
    const BusConfig& get_config() const { return config_; }

private:
    struct Subscription {
        SubscriptionId id;
        EventHandler handler;
        EventFilter filter;
        int priority;
        bool once;
    };

    struct PatternEntry {
        EventPattern compiled;
        std::vector<Subscription> subscriptions;
    };

    void dispatch_loop();
    void dispatch(const Event& event);
    std::vector<Subscription> matching_subscriptions(const std::string& event_type) const;
    void record_failure(const Event& event, const std::string& error);
    void record_history(const Event& event);
    std::string generate_id();

    BusConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    PriorityQueue<Event> queue_;
    DeadLetterStore dead_letters_;
    std::deque<Event> history_;
    std::vector<PatternEntry> patterns_;    // pattern registration order
    bool dispatching_ = false;
    bool stopping_ = false;

    uint64_t events_emitted_ = 0;
    uint64_t events_dispatched_ = 0;
    uint64_t handler_failures_ = 0;

    std::atomic<uint64_t> next_event_seq_{1};
    std::atomic<SubscriptionId> next_subscription_id_{1};

    std::thread dispatcher_;
};

} // namespace everos::kernel

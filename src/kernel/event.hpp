#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "kernel/priority_queue.hpp"

namespace everos::kernel {

// Bus event. Immutable once emitted; handlers only ever see a const reference.
struct Event {
    std::string id;
    std::string type;                           // "domain:verb"
    nlohmann::json payload;
    std::string source = "system";
    std::optional<std::string> target;
    EventPriority priority = EventPriority::NORMAL;
    uint64_t timestamp_ms = 0;                  // wall clock, ms since epoch
    std::optional<std::string> correlation_id;
    std::optional<std::string> reply_to;
    nlohmann::json metadata;                    // null when absent

    nlohmann::json to_json() const;
};

// Optional fields for EventBus::emit
struct EmitOptions {
    std::string source;                         // empty = "system"
    std::optional<std::string> target;
    EventPriority priority = EventPriority::NORMAL;
    std::optional<std::string> correlation_id;
    std::optional<std::string> reply_to;
    nlohmann::json metadata;
};

using SubscriptionId = uint64_t;
using EventHandler = std::function<void(const Event&)>;
using EventFilter = std::function<bool(const Event&)>;

struct SubscribeOptions {
    int priority = 0;           // higher runs first; ties keep registration order
    EventFilter filter;         // skipped events neither invoke nor consume a once handler
    bool once = false;
};

// Milliseconds since the Unix epoch
uint64_t now_ms();

} // namespace everos::kernel

#include "kernel/event.hpp"
#include <chrono>

namespace everos::kernel {

nlohmann::json Event::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["type"] = type;
    j["payload"] = payload;
    j["source"] = source;
    j["priority"] = event_priority_to_string(priority);
    j["timestamp"] = timestamp_ms;
    if (target) j["target"] = *target;
    if (correlation_id) j["correlationId"] = *correlation_id;
    if (reply_to) j["replyTo"] = *reply_to;
    if (!metadata.is_null()) j["metadata"] = metadata;
    return j;
}

uint64_t now_ms() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(duration).count());
}

} // namespace everos::kernel

#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/event.hpp"

namespace everos::kernel {

// An event at least one handler failed on
struct DeadLetter {
    Event event;
    std::string error;
    std::chrono::system_clock::time_point failed_at;
    uint32_t retry_count = 0;
    std::optional<std::chrono::system_clock::time_point> last_retry;

    nlohmann::json to_json() const;
};

// Bounded event-id -> DeadLetter map. Not synchronised; EventBus guards it.
class DeadLetterStore {
public:
    static constexpr size_t kDefaultMaxSize = 1000;
    static constexpr uint32_t kDefaultMaxRetries = 3;

    explicit DeadLetterStore(size_t max_size = kDefaultMaxSize,
                             uint32_t max_retries = kDefaultMaxRetries);

    // Insert with retry_count 0, or bump retry_count of the existing entry
    void add(const Event& event, const std::string& error);

    // Hands the stored event to requeue and keeps the entry, so a repeated
    // failure increments instead of duplicating. False if unknown or exhausted.
    bool retry(const std::string& event_id, const std::function<void(const Event&)>& requeue) const;

    bool remove(const std::string& event_id);
    std::optional<DeadLetter> get(const std::string& event_id) const;
    std::vector<DeadLetter> get_all() const;
    std::vector<DeadLetter> get_retriable() const;
    size_t size() const { return letters_.size(); }
    void clear();

    size_t max_size() const { return max_size_; }
    uint32_t max_retries() const { return max_retries_; }

private:
    void prune();

    std::unordered_map<std::string, DeadLetter> letters_;
    std::deque<std::string> order_;     // insertion order == failed_at order
    size_t max_size_;
    uint32_t max_retries_;
};

} // namespace everos::kernel

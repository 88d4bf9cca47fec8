#include "kernel/dead_letter_store.hpp"
#include <algorithm>

namespace everos::kernel {

namespace {

uint64_t to_millis(std::chrono::system_clock::time_point tp) {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
}

} // namespace

nlohmann::json DeadLetter::to_json() const {
    nlohmann::json j;
    j["event"] = event.to_json();
    j["error"] = error;
    j["failedAt"] = to_millis(failed_at);
    j["retryCount"] = retry_count;
    if (last_retry) {
        j["lastRetry"] = to_millis(*last_retry);
    }
    return j;
}

DeadLetterStore::DeadLetterStore(size_t max_size, uint32_t max_retries)
    : max_size_(max_size), max_retries_(max_retries) {}

void DeadLetterStore::add(const Event& event, const std::string& error) {
    auto now = std::chrono::system_clock::now();
    auto it = letters_.find(event.id);
    if (it != letters_.end()) {
        it->second.retry_count++;
        it->second.error = error;
        it->second.last_retry = now;
        return;
    }

    DeadLetter letter;
    letter.event = event;
    letter.error = error;
    letter.failed_at = now;
    letters_.emplace(event.id, std::move(letter));
    order_.push_back(event.id);

    prune();
}

bool DeadLetterStore::retry(const std::string& event_id,
                            const std::function<void(const Event&)>& requeue) const {
    auto it = letters_.find(event_id);
    if (it == letters_.end()) return false;
    if (it->second.retry_count >= max_retries_) return false;

    requeue(it->second.event);
    return true;
}

bool DeadLetterStore::remove(const std::string& event_id) {
    if (letters_.erase(event_id) == 0) {
        return false;
    }
    order_.erase(std::remove(order_.begin(), order_.end(), event_id), order_.end());
    return true;
}

std::optional<DeadLetter> DeadLetterStore::get(const std::string& event_id) const {
    auto it = letters_.find(event_id);
    if (it == letters_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<DeadLetter> DeadLetterStore::get_all() const {
    std::vector<DeadLetter> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        result.push_back(letters_.at(id));
    }
    return result;
}

std::vector<DeadLetter> DeadLetterStore::get_retriable() const {
    std::vector<DeadLetter> result;
    for (const auto& id : order_) {
        const auto& letter = letters_.at(id);
        if (letter.retry_count < max_retries_) {
            result.push_back(letter);
        }
    }
    return result;
}

void DeadLetterStore::clear() {
    letters_.clear();
    order_.clear();
}

void DeadLetterStore::prune() {
    while (letters_.size() > max_size_ && !order_.empty()) {
        letters_.erase(order_.front());
        order_.pop_front();
    }
}

} // namespace everos::kernel

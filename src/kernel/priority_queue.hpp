#pragma once
#include <array>
#include <cstddef>
#include <deque>
#include <optional>
#include <string>

namespace everos::kernel {

// Event priority tiers, highest first
enum class EventPriority {
    CRITICAL = 0,
    HIGH = 1,
    NORMAL = 2,
    LOW = 3
};

constexpr size_t kPriorityCount = 4;

inline const char* event_priority_to_string(EventPriority priority) {
    switch (priority) {
        case EventPriority::CRITICAL: return "critical";
        case EventPriority::HIGH:     return "high";
        case EventPriority::NORMAL:   return "normal";
        case EventPriority::LOW:      return "low";
        default: return "normal";
    }
}

inline EventPriority event_priority_from_string(const std::string& str) {
    if (str == "critical") return EventPriority::CRITICAL;
    if (str == "high")     return EventPriority::HIGH;
    if (str == "low")      return EventPriority::LOW;
    return EventPriority::NORMAL;
}

// Four FIFO tiers; dequeue drains the highest non-empty tier first.
// Not synchronised, the owner guards it.
template <typename T>
class PriorityQueue {
public:
    void enqueue(T item, EventPriority priority = EventPriority::NORMAL) {
        tiers_[index(priority)].push_back(std::move(item));
        ++size_;
    }

    std::optional<T> dequeue() {
        for (auto& tier : tiers_) {
            if (!tier.empty()) {
                std::optional<T> item(std::move(tier.front()));
                tier.pop_front();
                --size_;
                return item;
            }
        }
        return std::nullopt;
    }

    // Next item dequeue() would return, nullptr when empty
    const T* peek() const {
        for (const auto& tier : tiers_) {
            if (!tier.empty()) {
                return &tier.front();
            }
        }
        return nullptr;
    }

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    std::array<size_t, kPriorityCount> size_by_priority() const {
        std::array<size_t, kPriorityCount> sizes{};
        for (size_t i = 0; i < kPriorityCount; ++i) {
            sizes[i] = tiers_[i].size();
        }
        return sizes;
    }

    void clear() {
        for (auto& tier : tiers_) {
            tier.clear();
        }
        size_ = 0;
    }

private:
    static size_t index(EventPriority priority) {
        auto i = static_cast<size_t>(priority);
        return i < kPriorityCount ? i : static_cast<size_t>(EventPriority::NORMAL);
    }

    std::array<std::deque<T>, kPriorityCount> tiers_;
    size_t size_ = 0;
};

} // namespace everos::kernel

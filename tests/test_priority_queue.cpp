#include <doctest/doctest.h>

#include <string>
#include "kernel/priority_queue.hpp"

using everos::kernel::EventPriority;
using everos::kernel::PriorityQueue;

TEST_CASE("PriorityQueue drains higher tiers first and keeps FIFO within a tier") {
    PriorityQueue<std::string> queue;
    queue.enqueue("low", EventPriority::LOW);
    queue.enqueue("normal-1");
    queue.enqueue("critical", EventPriority::CRITICAL);
    queue.enqueue("normal-2", EventPriority::NORMAL);
    queue.enqueue("high", EventPriority::HIGH);

    REQUIRE(queue.size() == 5);
    REQUIRE(queue.peek() != nullptr);
    CHECK(*queue.peek() == "critical");

    CHECK(*queue.dequeue() == "critical");
    CHECK(*queue.dequeue() == "high");
    CHECK(*queue.dequeue() == "normal-1");
    CHECK(*queue.dequeue() == "normal-2");
    CHECK(*queue.dequeue() == "low");
    CHECK(queue.empty());
    CHECK_FALSE(queue.dequeue().has_value());
    CHECK(queue.peek() == nullptr);
}

TEST_CASE("PriorityQueue reports per-tier sizes and clears") {
    PriorityQueue<int> queue;
    queue.enqueue(1, EventPriority::HIGH);
    queue.enqueue(2, EventPriority::HIGH);
    queue.enqueue(3, EventPriority::LOW);

    auto sizes = queue.size_by_priority();
    CHECK(sizes[0] == 0);
    CHECK(sizes[1] == 2);
    CHECK(sizes[2] == 0);
    CHECK(sizes[3] == 1);

    queue.clear();
    CHECK(queue.size() == 0);
    CHECK(queue.empty());
}

TEST_CASE("EventPriority string conversion") {
    CHECK(std::string(everos::kernel::event_priority_to_string(EventPriority::CRITICAL)) == "critical");
    CHECK(std::string(everos::kernel::event_priority_to_string(EventPriority::LOW)) == "low");
    CHECK(everos::kernel::event_priority_from_string("high") == EventPriority::HIGH);
    CHECK(everos::kernel::event_priority_from_string("bogus") == EventPriority::NORMAL);
}

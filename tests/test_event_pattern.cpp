#include <doctest/doctest.h>

#include "kernel/event_pattern.hpp"

using everos::kernel::EventPattern;
using everos::kernel::PatternKind;

TEST_CASE("EventPattern match-all") {
    auto p = EventPattern::compile("*");
    CHECK(p.kind() == PatternKind::ALL);
    CHECK(p.matches("clock:tick"));
    CHECK(p.matches(""));
}

TEST_CASE("EventPattern prefix") {
    auto p = EventPattern::compile("price:*");
    CHECK(p.kind() == PatternKind::PREFIX);
    CHECK(p.matches("price:update"));
    CHECK(p.matches("price:update:btc"));
    CHECK_FALSE(p.matches("price"));
    CHECK_FALSE(p.matches("prices:update"));
    CHECK_FALSE(p.matches("stock:price:update"));
}

TEST_CASE("EventPattern suffix") {
    auto p = EventPattern::compile("*:error");
    CHECK(p.kind() == PatternKind::SUFFIX);
    CHECK(p.matches("agent:error"));
    CHECK(p.matches("a:b:error"));
    CHECK_FALSE(p.matches("error"));
    CHECK_FALSE(p.matches("agent:errors"));
}

TEST_CASE("EventPattern exact") {
    auto p = EventPattern::compile("clock:minute");
    CHECK(p.kind() == PatternKind::EXACT);
    CHECK(p.pattern() == "clock:minute");
    CHECK(p.matches("clock:minute"));
    CHECK_FALSE(p.matches("clock:minutes"));
    CHECK_FALSE(p.matches("clock:second"));

    SUBCASE("bare separators are wildcards") {
        auto any_prefix = EventPattern::compile(":*");
        CHECK(any_prefix.kind() == PatternKind::PREFIX);
        CHECK(any_prefix.matches(":boot"));
        CHECK_FALSE(any_prefix.matches("boot"));

        auto any_suffix = EventPattern::compile("*:");
        CHECK(any_suffix.kind() == PatternKind::SUFFIX);
        CHECK(any_suffix.matches("clock:"));
        CHECK_FALSE(any_suffix.matches("clock"));
    }

    SUBCASE("a star without a separator is exact") {
        CHECK(EventPattern::compile("a*").kind() == PatternKind::EXACT);
        CHECK_FALSE(EventPattern::compile("a*").matches("ab"));
    }
}

#pragma once
#include <string>

namespace everos::kernel {

enum class PatternKind {
    ALL,        // "*"
    PREFIX,     // "clock:*"  -> type starts with "clock:"
    SUFFIX,     // "*:error"  -> type ends with ":error"
    EXACT
};

// Subscription pattern compiled once at subscribe time
class EventPattern {
public:
    static EventPattern compile(const std::string& pattern);

    bool matches(const std::string& event_type) const;

    PatternKind kind() const { return kind_; }
    const std::string& pattern() const { return pattern_; }

private:
    EventPattern(PatternKind kind, std::string pattern, std::string operand);

    PatternKind kind_;
    std::string pattern_;
    std::string operand_;   // prefix, suffix or exact type
};

} // namespace everos::kernel

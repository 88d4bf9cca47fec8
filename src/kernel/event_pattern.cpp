#include "kernel/event_pattern.hpp"

namespace everos::kernel {

EventPattern::EventPattern(PatternKind kind, std::string pattern, std::string operand)
    : kind_(kind), pattern_(std::move(pattern)), operand_(std::move(operand)) {}

EventPattern EventPattern::compile(const std::string& pattern) {
    if (pattern == "*") {
        return EventPattern(PatternKind::ALL, pattern, "");
    }
    if (pattern.size() >= 2 && pattern.compare(pattern.size() - 2, 2, ":*") == 0) {
        // keep the trailing ':' so "clock:*" does not match "clockwork"
        return EventPattern(PatternKind::PREFIX, pattern, pattern.substr(0, pattern.size() - 1));
    }
    if (pattern.size() >= 2 && pattern.compare(0, 2, "*:") == 0) {
        return EventPattern(PatternKind::SUFFIX, pattern, pattern.substr(1));
    }
    return EventPattern(PatternKind::EXACT, pattern, pattern);
}

bool EventPattern::matches(const std::string& event_type) const {
    switch (kind_) {
        case PatternKind::ALL:
            return true;
        case PatternKind::PREFIX:
            return event_type.compare(0, operand_.size(), operand_) == 0;
        case PatternKind::SUFFIX:
            return event_type.size() >= operand_.size() &&
                   event_type.compare(event_type.size() - operand_.size(),
                                      operand_.size(), operand_) == 0;
        case PatternKind::EXACT:
        default:
            return event_type == operand_;
    }
}

} // namespace everos::kernel

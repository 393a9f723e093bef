#include "rune_lock/rules/runic.hpp"
#include "rune_lock/lock.hpp"
#include <sstream>

namespace rune_lock {

// ============================================================================
// DifferentRunesRule implementation
// ============================================================================

DifferentRunesRule::DifferentRunesRule(Activation first, Activation second)
    : ActivationPairRule(first, second) {}

std::string DifferentRunesRule::name() const {
    return "different_runes";
}

std::string DifferentRunesRule::describe() const {
    return describe_pair("are Different Runes");
}

bool DifferentRunesRule::holds(const Lock& lock, Position first, Position second) const {
    return lock.rune(first) != lock.rune(second);
}

// ============================================================================
// RuneFollowsImmediatelyRule implementation
// ============================================================================

RuneFollowsImmediatelyRule::RuneFollowsImmediatelyRule(Rune first, Rune second)
    : first_(first)
    , second_(second) {}

std::string RuneFollowsImmediatelyRule::name() const {
    return "rune_follows_immediately";
}

std::string RuneFollowsImmediatelyRule::describe() const {
    std::ostringstream os;
    os << second_ << " immediately follows " << first_;
    return os.str();
}

RuleStatus RuneFollowsImmediatelyRule::validate(const Lock& lock,
                                                const Assignment& assignment) const {
    for (size_t i = 0; i < LOCK_SIZE; ++i) {
        Position position(i);
        if (lock.rune(position) != first_) {
            continue;
        }
        auto activation = assignment.activation_at(position);
        if (!activation) {
            continue;
        }
        auto next = activation->next();
        if (!next) {
            // 最後の値の後には何も続かない
            return RuleStatus::Unfulfillable;
        }
        auto next_position = assignment.position_of(*next);
        if (next_position && lock.rune(*next_position) != second_) {
            return RuleStatus::Violated;
        }
    }
    return RuleStatus::Ok;
}

bool RuneFollowsImmediatelyRule::involves(const Lock& lock, Position position,
                                          Activation) const {
    return lock.rune(position) == first_;
}

std::vector<Activation> RuneFollowsImmediatelyRule::counterparts(const Lock&, Position,
                                                                 Activation activation) const {
    std::vector<Activation> result;
    if (auto next = activation.next()) {
        result.push_back(*next);
    }
    return result;
}

} // namespace rune_lock

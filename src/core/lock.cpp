#include "rune_lock/lock.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace rune_lock {

Lock::Lock(std::array<Rune, LOCK_SIZE> runes, std::vector<RulePtr> rules)
    : runes_(runes)
    , rules_(std::move(rules)) {}

const Rule& Lock::rule(size_t index) const {
    if (index >= rules_.size()) {
        throw std::out_of_range("Rule index out of range: " + std::to_string(index));
    }
    return *rules_[index];
}

std::optional<LockViolation> Lock::validate(const Assignment& assignment) const {
    for (size_t i = 0; i < rules_.size(); ++i) {
        RuleStatus status = rules_[i]->validate(*this, assignment);
        if (status != RuleStatus::Ok) {
            return LockViolation{i, status};
        }
    }
    return std::nullopt;
}

} // namespace rune_lock

/**
 * @file rule.cpp
 * @brief ルール基底クラスの実装
 *
 * 各ルールの実装は src/core/rules/ 以下の個別ファイルに配置:
 * - rules/geometric.cpp: 位置関係ルール
 * - rules/runic.cpp: ルーンを参照するルール
 */
#include "rune_lock/rule.hpp"
#include "rune_lock/lock.hpp"
#include <sstream>

namespace rune_lock {

std::ostream& operator<<(std::ostream& os, RuleStatus status) {
    switch (status) {
        case RuleStatus::Ok: return os << "ok";
        case RuleStatus::Violated: return os << "violated";
        case RuleStatus::Unfulfillable: return os << "not fulfillable";
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const Rule& rule) {
    return os << rule.describe();
}

RuleStatus Rule::validate_pair(const Lock& lock,
                               const Assignment::Pair& a,
                               const Assignment::Pair& b) const {
    // 同じ位置・同じアクティベーションの2組は共存できない
    if (a.first == b.first || a.second == b.second) {
        return RuleStatus::Violated;
    }
    Assignment probe;
    probe.assign(a.first, a.second);
    probe.assign(b.first, b.second);
    return validate(lock, probe);
}

// ============================================================================
// ActivationPairRule implementation
// ============================================================================

ActivationPairRule::ActivationPairRule(Activation first, Activation second)
    : first_(first)
    , second_(second) {}

RuleStatus ActivationPairRule::validate(const Lock& lock, const Assignment& assignment) const {
    auto one = assignment.position_of(first_);
    auto two = assignment.position_of(second_);

    if (one && two) {
        return holds(lock, *one, *two) ? RuleStatus::Ok : RuleStatus::Violated;
    }
    if ((one || two) && unfulfillable(lock, assignment, one, two)) {
        return RuleStatus::Unfulfillable;
    }
    return RuleStatus::Ok;
}

bool ActivationPairRule::involves(const Lock&, Position, Activation activation) const {
    return activation == first_ || activation == second_;
}

std::vector<Activation> ActivationPairRule::counterparts(const Lock&, Position,
                                                         Activation activation) const {
    std::vector<Activation> result;
    if (activation == first_) {
        result.push_back(second_);
    }
    if (activation == second_ && first_ != second_) {
        result.push_back(first_);
    }
    return result;
}

bool ActivationPairRule::unfulfillable(const Lock&, const Assignment&,
                                       std::optional<Position>,
                                       std::optional<Position>) const {
    return false;
}

std::string ActivationPairRule::describe_pair(const std::string& relation) const {
    std::ostringstream os;
    os << first_ << " & " << second_ << " " << relation;
    return os.str();
}

} // namespace rune_lock

/**
 * @file runic.hpp
 * @brief ルーンを参照するルール (different runes, rune follows immediately)
 */
#ifndef RUNE_LOCK_RULES_RUNIC_HPP
#define RUNE_LOCK_RULES_RUNIC_HPP

#include "rune_lock/rule.hpp"

namespace rune_lock {

/**
 * @brief first と second が異なるルーンのスロットにある
 */
class DifferentRunesRule : public ActivationPairRule {
public:
    DifferentRunesRule(Activation first, Activation second);

    std::string name() const override;
    std::string describe() const override;

protected:
    bool holds(const Lock& lock, Position first, Position second) const override;
};

/**
 * @brief ルーン first のスロットに置かれた値の次の値は、ルーン second のスロットにある
 *
 * アクティベーションではなくルーンを参照する唯一のルール。
 * first のスロットすべてを走査し、配置済みの値 a について a + 1 の位置を調べる。
 * a + 1 が存在しない（a が最後）場合は Unfulfillable。
 */
class RuneFollowsImmediatelyRule : public Rule {
public:
    RuneFollowsImmediatelyRule(Rune first, Rune second);

    Rune first() const { return first_; }
    Rune second() const { return second_; }

    std::string name() const override;
    std::string describe() const override;
    RuleStatus validate(const Lock& lock, const Assignment& assignment) const override;
    bool involves(const Lock& lock, Position position, Activation activation) const override;
    std::vector<Activation> counterparts(const Lock& lock, Position position,
                                         Activation activation) const override;

private:
    Rune first_;
    Rune second_;
};

} // namespace rune_lock

#endif // RUNE_LOCK_RULES_RUNIC_HPP

/**
 * @file rule.hpp
 * @brief ルール基底クラスと全ルールヘッダのインクルード
 */
#ifndef RUNE_LOCK_RULE_HPP
#define RUNE_LOCK_RULE_HPP

#include "rune_lock/assignment.hpp"
#include "rune_lock/rune.hpp"
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace rune_lock {

// Forward declaration
class Lock;

/**
 * @brief ルール検証の結果
 */
enum class RuleStatus {
    Ok,             // まだ破れていない
    Violated,       // 配置済みの組が関係を満たさない
    Unfulfillable   // 片方しか配置されていないが、相手を置ける場所がもう無い
};

std::ostream& operator<<(std::ostream& os, RuleStatus status);

/**
 * @brief ルールの基底クラス
 *
 * パズル定義時に作られ、以後変更されない。
 * 正当化ではロック内のインデックスで参照される。
 */
class Rule {
public:
    virtual ~Rule() = default;

    /**
     * @brief ルールの短い名前
     */
    virtual std::string name() const = 0;

    /**
     * @brief 人間向けの説明（例: "#2 & #3 are Antakian Conjugates"）
     */
    virtual std::string describe() const = 0;

    /**
     * @brief 部分割当に対してルールを検証
     * @param lock ルーン配置の参照用
     * @param assignment 検証する（部分）割当
     */
    virtual RuleStatus validate(const Lock& lock, const Assignment& assignment) const = 0;

    /**
     * @brief 2つの組だけからなる使い捨ての割当で検証
     *
     * 伝播エンジンが候補を1つずつ試すために使う。
     * 2つの組が位置またはアクティベーションを共有する場合は共存できないので Violated。
     */
    RuleStatus validate_pair(const Lock& lock,
                             const Assignment::Pair& a,
                             const Assignment::Pair& b) const;

    /**
     * @brief 確定した組 (position, activation) がこのルールの伝播対象か
     */
    virtual bool involves(const Lock& lock, Position position, Activation activation) const = 0;

    /**
     * @brief 確定した組から再検査が必要なアクティベーション
     * @pre involves(lock, position, activation) が true
     */
    virtual std::vector<Activation> counterparts(const Lock& lock, Position position,
                                                 Activation activation) const = 0;
};

using RulePtr = std::shared_ptr<const Rule>;

std::ostream& operator<<(std::ostream& os, const Rule& rule);

/**
 * @brief 2つのアクティベーションの位置関係を規定するルールの基底
 *
 * 両方が配置済みなら holds() で判定し、片方だけなら unfulfillable() で
 * 相手の配置先が既に無いかを判定する。
 */
class ActivationPairRule : public Rule {
public:
    Activation first() const { return first_; }
    Activation second() const { return second_; }

    RuleStatus validate(const Lock& lock, const Assignment& assignment) const override;
    bool involves(const Lock& lock, Position position, Activation activation) const override;
    std::vector<Activation> counterparts(const Lock& lock, Position position,
                                         Activation activation) const override;

protected:
    ActivationPairRule(Activation first, Activation second);

    /**
     * @brief first/second の配置位置が関係を満たすか
     */
    virtual bool holds(const Lock& lock, Position first, Position second) const = 0;

    /**
     * @brief 片方だけ配置された状態で、相手の配置が既に不可能か
     *
     * デフォルトは常に false（両方が揃うまで破れない）。
     */
    virtual bool unfulfillable(const Lock& lock, const Assignment& assignment,
                               std::optional<Position> first,
                               std::optional<Position> second) const;

    /**
     * @brief "#a & #b <relation>" 形式の説明文
     */
    std::string describe_pair(const std::string& relation) const;

    Activation first_;
    Activation second_;
};

} // namespace rune_lock

// 各ルールグループのヘッダをインクルード
#include "rune_lock/rules/geometric.hpp"
#include "rune_lock/rules/runic.hpp"

#endif // RUNE_LOCK_RULE_HPP

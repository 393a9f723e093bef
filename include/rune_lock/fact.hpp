/**
 * @file fact.hpp
 * @brief 知識ベースに記録される事実とその正当化
 */
#ifndef RUNE_LOCK_FACT_HPP
#define RUNE_LOCK_FACT_HPP

#include "rune_lock/position.hpp"
#include "rune_lock/activation.hpp"
#include <cstddef>
#include <ostream>
#include <variant>
#include <vector>

namespace rune_lock {

/**
 * @brief 事実の種類
 */
enum class FactKind {
    MustBe,
    CannotBe,
    Contradiction
};

/**
 * @brief 矛盾の種類（FactKind::Contradiction のときのみ意味を持つ）
 */
enum class ContradictionKind {
    None,
    ContradictingRequirements,  // MustBe と CannotBe が同じセルで衝突
    NoOptionsLeft               // ある行の候補が尽きた
};

/**
 * @brief 事実ログへのインデックス（表示は F<n>）
 */
struct FactHandle {
    size_t id;

    bool operator==(const FactHandle& other) const { return id == other.id; }
    bool operator!=(const FactHandle& other) const { return id != other.id; }
    bool operator<(const FactHandle& other) const { return id < other.id; }
};

std::ostream& operator<<(std::ostream& os, const FactHandle& handle);

/**
 * @brief 引用を生んだ導出の種類
 */
enum class Origin {
    Integration,           // 衝突検出
    PositionUniqueness,    // 位置ごとの一意性
    ActivationUniqueness,  // アクティベーションごとの一意性
    RulePropagation        // ルール伝播
};

std::ostream& operator<<(std::ostream& os, Origin origin);

/**
 * @brief 別の事実を理由として引用
 */
struct FactCitation {
    FactHandle handle;
    Origin origin;

    bool operator==(const FactCitation& other) const {
        return handle == other.handle && origin == other.origin;
    }
    bool operator<(const FactCitation& other) const {
        if (handle != other.handle) return handle < other.handle;
        return origin < other.origin;
    }
};

/**
 * @brief ロックのルールを理由として引用（Lock::rules() のインデックス）
 */
struct RuleCitation {
    size_t rule_index;

    bool operator==(const RuleCitation& other) const { return rule_index == other.rule_index; }
    bool operator<(const RuleCitation& other) const { return rule_index < other.rule_index; }
};

/**
 * @brief 仮定として与えられた事実
 */
struct Assumed {
    bool operator==(const Assumed&) const { return true; }
    bool operator<(const Assumed&) const { return false; }
};

using FactReason = std::variant<FactCitation, RuleCitation, Assumed>;

/**
 * @brief 1つのセル (position, activation) についての事実
 *
 * 一度ログに追加された事実は変更されない。
 * reasons が引用するのは常にログ上でより前の事実。
 */
struct Fact {
    FactKind kind;
    ContradictionKind contradiction;
    Position position;
    Activation activation;
    std::vector<FactReason> reasons;

    static Fact must_be(Position position, Activation activation,
                        std::vector<FactReason> reasons);
    static Fact cannot_be(Position position, Activation activation,
                          std::vector<FactReason> reasons);
    static Fact contradiction_of(ContradictionKind kind, Position position,
                                 Activation activation, std::vector<FactReason> reasons);

    /**
     * @brief ユーザーの仮定 "position must be activation"
     */
    static Fact assumption(Position position, Activation activation);

    bool is_contradiction() const { return kind == FactKind::Contradiction; }
};

std::ostream& operator<<(std::ostream& os, FactKind kind);
std::ostream& operator<<(std::ostream& os, ContradictionKind kind);
std::ostream& operator<<(std::ostream& os, const Fact& fact);

} // namespace rune_lock

#endif // RUNE_LOCK_FACT_HPP

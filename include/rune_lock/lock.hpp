/**
 * @file lock.hpp
 * @brief パズル定義（各スロットのルーンとルール一覧）
 */
#ifndef RUNE_LOCK_LOCK_HPP
#define RUNE_LOCK_LOCK_HPP

#include "rune_lock/rule.hpp"
#include <array>
#include <optional>
#include <vector>

namespace rune_lock {

/**
 * @brief 割当が破ったルール
 */
struct LockViolation {
    size_t rule_index;
    RuleStatus status;
};

/**
 * @brief ルーンロック
 *
 * ルーン配置（外側リング、内側リングの順）とルールの並びを保持する。
 * 構築後は読み取り専用。
 */
class Lock {
public:
    Lock(std::array<Rune, LOCK_SIZE> runes, std::vector<RulePtr> rules);

    Rune rune(Position position) const { return runes_[position.index()]; }
    const std::array<Rune, LOCK_SIZE>& runes() const { return runes_; }
    const std::vector<RulePtr>& rules() const { return rules_; }

    /**
     * @brief インデックスでルールを取得
     * @throws std::out_of_range 存在しないインデックスの場合
     */
    const Rule& rule(size_t index) const;

    /**
     * @brief 割当を全ルールで検証
     * @return 最初に破れたルール、なければ std::nullopt
     */
    std::optional<LockViolation> validate(const Assignment& assignment) const;

private:
    std::array<Rune, LOCK_SIZE> runes_;
    std::vector<RulePtr> rules_;
};

} // namespace rune_lock

#endif // RUNE_LOCK_LOCK_HPP

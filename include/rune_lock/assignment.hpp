/**
 * @file assignment.hpp
 * @brief 位置とアクティベーションの部分的な単射割当
 */
#ifndef RUNE_LOCK_ASSIGNMENT_HPP
#define RUNE_LOCK_ASSIGNMENT_HPP

#include "rune_lock/position.hpp"
#include "rune_lock/activation.hpp"
#include <array>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace rune_lock {

/**
 * @brief 割当の不変条件違反（同じアクティベーション/位置の二重割当）
 *
 * 伝播ロジックのバグを示すので、パズルの矛盾とは区別して扱う。
 */
class AssignmentError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * @brief 部分割当 Position <-> Activation
 *
 * 2つの逆引き配列を常に整合させて保持し、どちら向きの参照も O(1)。
 * 各位置に高々1つ、各アクティベーションに高々1つの相手しか持たない。
 */
class Assignment {
public:
    using Pair = std::pair<Position, Activation>;

    /**
     * @brief 空の割当を作成
     */
    Assignment();

    /**
     * @brief ペアのリストから割当を作成
     * @throws AssignmentError 位置またはアクティベーションが重複した場合
     */
    static Assignment from_pairs(const std::vector<Pair>& pairs);

    /**
     * @brief 位置に割り当てられたアクティベーション
     */
    std::optional<Activation> activation_at(Position position) const {
        return activation_of_position_[position.index()];
    }

    /**
     * @brief アクティベーションが割り当てられた位置
     */
    std::optional<Position> position_of(Activation activation) const {
        return position_of_activation_[activation.index()];
    }

    /**
     * @brief 割り当てる
     *
     * 位置が埋まっている、またはアクティベーションが配置済みの場合は
     * 古い組を黙って取り除く（一時的な検証用）。
     */
    void assign(Position position, Activation activation);

    /**
     * @brief アクティベーションが配置済みか
     */
    bool contains(Activation activation) const { return position_of(activation).has_value(); }

    /**
     * @brief 配置済みの組の数
     */
    size_t size() const;

    /**
     * @brief 全位置が埋まっているか
     */
    bool is_complete() const { return size() == LOCK_SIZE; }

    /**
     * @brief 配置済みの組を位置順に取得
     */
    std::vector<Pair> pairs() const;

private:
    std::array<std::optional<Activation>, LOCK_SIZE> activation_of_position_;
    std::array<std::optional<Position>, LOCK_SIZE> position_of_activation_;
};

} // namespace rune_lock

#endif // RUNE_LOCK_ASSIGNMENT_HPP

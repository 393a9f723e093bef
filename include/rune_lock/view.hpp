/**
 * @file view.hpp
 * @brief 12x12 グリッドの1行（ある位置、またはあるアクティベーション）
 */
#ifndef RUNE_LOCK_VIEW_HPP
#define RUNE_LOCK_VIEW_HPP

#include "rune_lock/position.hpp"
#include "rune_lock/activation.hpp"
#include <cstddef>
#include <ostream>
#include <utility>

namespace rune_lock {

/**
 * @brief グリッドの行を表すビュー
 *
 * Position 軸なら位置を固定して全アクティベーションを、
 * Activation 軸ならアクティベーションを固定して全位置を走査する。
 * 一意性の推論はこの抽象の上で一度だけ書く。
 */
class View {
public:
    enum class Axis { Position, Activation };

    using Cell = std::pair<Position, Activation>;

    static View of(Position position) { return View(Axis::Position, position.index()); }
    static View of(Activation activation) { return View(Axis::Activation, activation.index()); }

    Axis axis() const { return axis_; }
    size_t index() const { return index_; }

    /**
     * @brief 補完側インデックス k のセル
     */
    Cell cell(size_t k) const;

    bool operator==(const View& other) const {
        return axis_ == other.axis_ && index_ == other.index_;
    }

private:
    View(Axis axis, size_t index) : axis_(axis), index_(index) {}

    Axis axis_;
    size_t index_;
};

std::ostream& operator<<(std::ostream& os, const View& view);

} // namespace rune_lock

#endif // RUNE_LOCK_VIEW_HPP

/**
 * @file activation.hpp
 * @brief スロットに配置するアクティベーション（値）
 */
#ifndef RUNE_LOCK_ACTIVATION_HPP
#define RUNE_LOCK_ACTIVATION_HPP

#include "rune_lock/position.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>

namespace rune_lock {

/**
 * @brief アクティベーション [0, 12)
 *
 * 内部は 0 始まり、表示と入力は 1 始まり（#1 〜 #12）。
 */
class Activation {
public:
    /**
     * @brief 0 始まりのインデックスから作成
     * @throws std::out_of_range index >= LOCK_SIZE の場合
     */
    explicit Activation(size_t index);

    /**
     * @brief 1 始まりの番号から作成（ユーザー入力用）
     * @return 範囲外なら std::nullopt
     */
    static std::optional<Activation> from_human(int64_t one_based);

    /**
     * @brief 0 始まりのインデックスから作成
     * @return 範囲外なら std::nullopt
     */
    static std::optional<Activation> from_index(int64_t zero_based);

    size_t index() const { return index_; }

    /**
     * @brief 1 始まりの番号
     */
    size_t human() const { return index_ + 1; }

    /**
     * @brief 次のアクティベーション
     * @return 最後（#12）なら std::nullopt
     */
    std::optional<Activation> next() const;

    bool operator==(const Activation& other) const { return index_ == other.index_; }
    bool operator!=(const Activation& other) const { return index_ != other.index_; }
    bool operator<(const Activation& other) const { return index_ < other.index_; }

private:
    size_t index_;
};

std::ostream& operator<<(std::ostream& os, const Activation& activation);

} // namespace rune_lock

#endif // RUNE_LOCK_ACTIVATION_HPP

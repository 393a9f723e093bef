/**
 * @file position.hpp
 * @brief ロックのスロット位置と幾何関係（2つの6環からなるリング）
 */
#ifndef RUNE_LOCK_POSITION_HPP
#define RUNE_LOCK_POSITION_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>

namespace rune_lock {

/// ロックのスロット数（= アクティベーション数）
constexpr size_t LOCK_SIZE = 12;

/// 1つのリングに含まれるスロット数
constexpr size_t RING_SIZE = 6;

/**
 * @brief 各スロットの santor 値（外側リング 0-5、内側リング 6-11）
 *
 * 縦方向セクタの2要素が左右セクタより高い santor を持つ前提。
 * リングが等間隔に配置されていれば成り立つ。
 */
constexpr std::array<uint32_t, LOCK_SIZE> SANTOR = {
    7, 5, 2, 0, 2, 5,  // 外側リング
    6, 4, 3, 1, 3, 4,  // 内側リング
};
constexpr uint32_t MAX_SANTOR = 7;
constexpr uint32_t MIN_SANTOR = 0;

/**
 * @brief ロック上のスロット位置 [0, 12)
 *
 * 0-5 が外側リング、6-11 が内側リング。
 * 関係判定はすべて副作用のない純粋関数。
 */
class Position {
public:
    /**
     * @brief 位置を作成
     * @throws std::out_of_range index >= LOCK_SIZE の場合
     */
    explicit Position(size_t index);

    /**
     * @brief 外部入力から位置を作成
     * @return 範囲外なら std::nullopt
     */
    static std::optional<Position> from_index(int64_t index);

    size_t index() const { return index_; }

    /**
     * @brief 外側リングに属するか
     */
    bool is_outer() const { return index_ < RING_SIZE; }

    /**
     * @brief 同じリング上の点対称位置（3つ隣）
     */
    Position antakian_conjugate() const;

    /**
     * @brief other が同じリング上の点対称位置か
     */
    bool antakian_conjugate_of(Position other) const;

    /**
     * @brief this が other から見てリング上で1〜2つ先にあるか（有向）
     */
    bool alwanese_of(Position other) const;

    /**
     * @brief リングを無視して3つ隣（= 対角）にあるか
     */
    bool alwanese_conjugate_of(Position other) const;

    /**
     * @brief 同じリングに属するか（自身も含む）
     */
    bool antakian_twins(Position other) const;

    /**
     * @brief other の santor が this より大きいか
     */
    bool increases_santor(Position other) const;

    uint32_t santor() const { return SANTOR[index_]; }

    /**
     * @brief 二重リングの接続規則で隣接しているか
     *
     * 同じリング上なら6環の隣、異なるリングなら同じセクタ（i + 6）。
     */
    bool max_0_conductive(Position other) const;

    bool operator==(const Position& other) const { return index_ == other.index_; }
    bool operator!=(const Position& other) const { return index_ != other.index_; }
    bool operator<(const Position& other) const { return index_ < other.index_; }

private:
    size_t index_;
};

std::ostream& operator<<(std::ostream& os, const Position& position);

} // namespace rune_lock

#endif // RUNE_LOCK_POSITION_HPP

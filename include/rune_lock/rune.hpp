/**
 * @file rune.hpp
 * @brief スロットに刻まれたルーン（ラベル）
 */
#ifndef RUNE_LOCK_RUNE_HPP
#define RUNE_LOCK_RUNE_HPP

#include <cstdint>
#include <ostream>

namespace rune_lock {

/**
 * @brief ルーン（Z = 0, V = 1, S = 2, C = 3）
 *
 * パズル定義時に各スロットへ割り当てられ、以後変更されない。
 */
class Rune {
public:
    static constexpr uint8_t Z = 0;
    static constexpr uint8_t V = 1;
    static constexpr uint8_t S = 2;
    static constexpr uint8_t C = 3;

    Rune() : id_(Z) {}
    explicit Rune(uint8_t id) : id_(id) {}

    uint8_t id() const { return id_; }

    bool operator==(const Rune& other) const { return id_ == other.id_; }
    bool operator!=(const Rune& other) const { return id_ != other.id_; }

private:
    uint8_t id_;
};

std::ostream& operator<<(std::ostream& os, const Rune& rune);

} // namespace rune_lock

#endif // RUNE_LOCK_RUNE_HPP

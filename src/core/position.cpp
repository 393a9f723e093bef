#include "rune_lock/position.hpp"
#include <stdexcept>
#include <string>

namespace rune_lock {

Position::Position(size_t index)
    : index_(index) {
    if (index >= LOCK_SIZE) {
        throw std::out_of_range("Position index out of range: " + std::to_string(index));
    }
}

std::optional<Position> Position::from_index(int64_t index) {
    if (index < 0 || index >= static_cast<int64_t>(LOCK_SIZE)) {
        return std::nullopt;
    }
    return Position(static_cast<size_t>(index));
}

Position Position::antakian_conjugate() const {
    if (is_outer()) {
        return Position((index_ + 3) % RING_SIZE);
    }
    return Position((index_ + 3) % RING_SIZE + RING_SIZE);
}

bool Position::antakian_conjugate_of(Position other) const {
    return antakian_twins(other) && alwanese_conjugate_of(other);
}

bool Position::alwanese_of(Position other) const {
    // リングをまたいでも同じセクタ番号で距離を測る
    size_t distance = (LOCK_SIZE + index_ - other.index_) % RING_SIZE;
    return distance > 0 && distance <= 2;
}

bool Position::alwanese_conjugate_of(Position other) const {
    return index_ % RING_SIZE == (other.index_ + 3) % RING_SIZE;
}

bool Position::antakian_twins(Position other) const {
    return is_outer() == other.is_outer();
}

bool Position::increases_santor(Position other) const {
    return santor() < other.santor();
}

bool Position::max_0_conductive(Position other) const {
    if (antakian_twins(other)) {
        return (index_ + 1) % RING_SIZE == other.index_ % RING_SIZE ||
               (other.index_ + 1) % RING_SIZE == index_ % RING_SIZE;
    }
    return (index_ + RING_SIZE) % LOCK_SIZE == other.index_;
}

std::ostream& operator<<(std::ostream& os, const Position& position) {
    return os << position.index();
}

} // namespace rune_lock

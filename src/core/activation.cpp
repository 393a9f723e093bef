#include "rune_lock/activation.hpp"
#include <stdexcept>
#include <string>

namespace rune_lock {

Activation::Activation(size_t index)
    : index_(index) {
    if (index >= LOCK_SIZE) {
        throw std::out_of_range("Activation index out of range: " + std::to_string(index));
    }
}

std::optional<Activation> Activation::from_human(int64_t one_based) {
    if (one_based < 1) {
        return std::nullopt;
    }
    return from_index(one_based - 1);
}

std::optional<Activation> Activation::from_index(int64_t zero_based) {
    if (zero_based < 0 || zero_based >= static_cast<int64_t>(LOCK_SIZE)) {
        return std::nullopt;
    }
    return Activation(static_cast<size_t>(zero_based));
}

std::optional<Activation> Activation::next() const {
    return from_index(static_cast<int64_t>(index_) + 1);
}

std::ostream& operator<<(std::ostream& os, const Activation& activation) {
    return os << '#' << activation.human();
}

} // namespace rune_lock

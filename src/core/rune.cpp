#include "rune_lock/rune.hpp"

namespace rune_lock {

std::ostream& operator<<(std::ostream& os, const Rune& rune) {
    switch (rune.id()) {
        case Rune::Z: return os << 'Z';
        case Rune::V: return os << 'V';
        case Rune::S: return os << 'S';
        case Rune::C: return os << 'C';
        default: return os << static_cast<int>(rune.id());
    }
}

} // namespace rune_lock

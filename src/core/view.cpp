#include "rune_lock/view.hpp"

namespace rune_lock {

View::Cell View::cell(size_t k) const {
    if (axis_ == Axis::Position) {
        return {Position(index_), Activation(k)};
    }
    return {Position(k), Activation(index_)};
}

std::ostream& operator<<(std::ostream& os, const View& view) {
    if (view.axis() == View::Axis::Position) {
        return os << "position " << Position(view.index());
    }
    return os << "activation " << Activation(view.index());
}

} // namespace rune_lock

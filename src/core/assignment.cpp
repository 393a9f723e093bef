#include "rune_lock/assignment.hpp"
#include <sstream>

namespace rune_lock {

Assignment::Assignment() = default;

Assignment Assignment::from_pairs(const std::vector<Pair>& pairs) {
    Assignment result;
    for (const auto& [position, activation] : pairs) {
        if (auto old = result.position_of(activation)) {
            std::ostringstream msg;
            msg << "Activation " << activation << " was assigned twice to "
                << position << " and " << *old;
            throw AssignmentError(msg.str());
        }
        if (auto old = result.activation_at(position)) {
            std::ostringstream msg;
            msg << "Position " << position << " was assigned twice to "
                << activation << " and " << *old;
            throw AssignmentError(msg.str());
        }
        result.assign(position, activation);
    }
    return result;
}

void Assignment::assign(Position position, Activation activation) {
    if (auto old = position_of_activation_[activation.index()]) {
        activation_of_position_[old->index()] = std::nullopt;
    }
    if (auto old = activation_of_position_[position.index()]) {
        position_of_activation_[old->index()] = std::nullopt;
    }
    position_of_activation_[activation.index()] = position;
    activation_of_position_[position.index()] = activation;
}

size_t Assignment::size() const {
    size_t count = 0;
    for (const auto& a : activation_of_position_) {
        if (a) ++count;
    }
    return count;
}

std::vector<Assignment::Pair> Assignment::pairs() const {
    std::vector<Pair> result;
    for (size_t i = 0; i < LOCK_SIZE; ++i) {
        if (activation_of_position_[i]) {
            result.emplace_back(Position(i), *activation_of_position_[i]);
        }
    }
    return result;
}

} // namespace rune_lock

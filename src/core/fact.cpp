#include "rune_lock/fact.hpp"
#include <utility>

namespace rune_lock {

std::ostream& operator<<(std::ostream& os, const FactHandle& handle) {
    return os << 'F' << handle.id;
}

std::ostream& operator<<(std::ostream& os, Origin origin) {
    switch (origin) {
        case Origin::Integration: return os << "integration";
        case Origin::PositionUniqueness: return os << "position uniqueness";
        case Origin::ActivationUniqueness: return os << "activation uniqueness";
        case Origin::RulePropagation: return os << "rule propagation";
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, FactKind kind) {
    switch (kind) {
        case FactKind::MustBe: return os << "must be";
        case FactKind::CannotBe: return os << "cannot be";
        case FactKind::Contradiction: return os << "contradiction";
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, ContradictionKind kind) {
    switch (kind) {
        case ContradictionKind::None: return os << "none";
        case ContradictionKind::ContradictingRequirements: return os << "contradicting requirements";
        case ContradictionKind::NoOptionsLeft: return os << "no options left";
    }
    return os;
}

Fact Fact::must_be(Position position, Activation activation,
                   std::vector<FactReason> reasons) {
    return Fact{FactKind::MustBe, ContradictionKind::None, position, activation,
                std::move(reasons)};
}

Fact Fact::cannot_be(Position position, Activation activation,
                     std::vector<FactReason> reasons) {
    return Fact{FactKind::CannotBe, ContradictionKind::None, position, activation,
                std::move(reasons)};
}

Fact Fact::contradiction_of(ContradictionKind kind, Position position,
                            Activation activation, std::vector<FactReason> reasons) {
    return Fact{FactKind::Contradiction, kind, position, activation, std::move(reasons)};
}

Fact Fact::assumption(Position position, Activation activation) {
    return must_be(position, activation, {Assumed{}});
}

std::ostream& operator<<(std::ostream& os, const Fact& fact) {
    switch (fact.kind) {
        case FactKind::MustBe:
            return os << fact.position << " must be on " << fact.activation;
        case FactKind::CannotBe:
            return os << fact.position << " cannot be on " << fact.activation;
        case FactKind::Contradiction:
            return os << fact.position << " caused a Contradiction on " << fact.activation
                      << " (" << fact.contradiction << ")";
    }
    return os;
}

} // namespace rune_lock

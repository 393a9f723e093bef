#include "rune_lock/rules/geometric.hpp"
#include "rune_lock/lock.hpp"

namespace rune_lock {

// ============================================================================
// AlwaneseRule implementation
// ============================================================================

AlwaneseRule::AlwaneseRule(Activation first, Activation second)
    : ActivationPairRule(first, second) {}

std::string AlwaneseRule::name() const {
    return "alwanese";
}

std::string AlwaneseRule::describe() const {
    return describe_pair("are Alwanese");
}

bool AlwaneseRule::holds(const Lock&, Position first, Position second) const {
    return second.alwanese_of(first);
}

// ============================================================================
// AntakianConjugatesRule implementation
// ============================================================================

AntakianConjugatesRule::AntakianConjugatesRule(Activation first, Activation second)
    : ActivationPairRule(first, second) {}

std::string AntakianConjugatesRule::name() const {
    return "antakian_conjugates";
}

std::string AntakianConjugatesRule::describe() const {
    return describe_pair("are Antakian Conjugates");
}

bool AntakianConjugatesRule::holds(const Lock&, Position first, Position second) const {
    return first.antakian_conjugate_of(second);
}

bool AntakianConjugatesRule::unfulfillable(const Lock&, const Assignment& assignment,
                                           std::optional<Position> first,
                                           std::optional<Position> second) const {
    // 相手の行き先は点対称位置の1つだけ。そこが埋まっていれば置けない
    auto placed = first ? first : second;
    return assignment.activation_at(placed->antakian_conjugate()).has_value();
}

// ============================================================================
// AlwaneseConjugatesRule implementation
// ============================================================================

AlwaneseConjugatesRule::AlwaneseConjugatesRule(Activation first, Activation second)
    : ActivationPairRule(first, second) {}

std::string AlwaneseConjugatesRule::name() const {
    return "alwanese_conjugates";
}

std::string AlwaneseConjugatesRule::describe() const {
    return describe_pair("are Alwanese Conjugates");
}

bool AlwaneseConjugatesRule::holds(const Lock&, Position first, Position second) const {
    return first.alwanese_conjugate_of(second);
}

// ============================================================================
// AntakianTwinsRule implementation
// ============================================================================

AntakianTwinsRule::AntakianTwinsRule(Activation first, Activation second)
    : ActivationPairRule(first, second) {}

std::string AntakianTwinsRule::name() const {
    return "antakian_twins";
}

std::string AntakianTwinsRule::describe() const {
    return describe_pair("are Antakian Twins");
}

bool AntakianTwinsRule::holds(const Lock&, Position first, Position second) const {
    return first.antakian_twins(second);
}

// ============================================================================
// IncreaseSantorRule implementation
// ============================================================================

IncreaseSantorRule::IncreaseSantorRule(Activation first, Activation second)
    : ActivationPairRule(first, second) {}

std::string IncreaseSantorRule::name() const {
    return "increase_santor";
}

std::string IncreaseSantorRule::describe() const {
    return describe_pair("increase Santor");
}

bool IncreaseSantorRule::holds(const Lock&, Position first, Position second) const {
    return first.increases_santor(second);
}

bool IncreaseSantorRule::unfulfillable(const Lock&, const Assignment&,
                                       std::optional<Position> first,
                                       std::optional<Position> second) const {
    if (first && !second) {
        return first->santor() == MAX_SANTOR;
    }
    if (second && !first) {
        return second->santor() == MIN_SANTOR;
    }
    return false;
}

// ============================================================================
// Max0ConductiveRule implementation
// ============================================================================

Max0ConductiveRule::Max0ConductiveRule(Activation first, Activation second)
    : ActivationPairRule(first, second) {}

std::string Max0ConductiveRule::name() const {
    return "max_0_conductive";
}

std::string Max0ConductiveRule::describe() const {
    return describe_pair("are max 0 Conductive");
}

bool Max0ConductiveRule::holds(const Lock&, Position first, Position second) const {
    return first.max_0_conductive(second);
}

} // namespace rune_lock

#include "rune_lock/puzzle.hpp"
#include <memory>

namespace rune_lock {

namespace {

/// 1 始まりの番号からアクティベーションを作る
Activation act(size_t one_based) {
    return Activation(one_based - 1);
}

} // namespace

Lock make_standard_lock() {
    const Rune Z(Rune::Z), V(Rune::V), S(Rune::S), C(Rune::C);

    std::array<Rune, LOCK_SIZE> runes = {
        Z, S, V, C, S, V,  // 外側リング
        C, S, V, Z, S, V,  // 内側リング
    };

    std::vector<RulePtr> rules = {
        std::make_shared<AlwaneseRule>(act(1), act(2)),
        std::make_shared<AntakianConjugatesRule>(act(2), act(3)),
        std::make_shared<AlwaneseRule>(act(3), act(4)),
        std::make_shared<AlwaneseConjugatesRule>(act(6), act(7)),
        std::make_shared<AntakianConjugatesRule>(act(6), act(8)),
        std::make_shared<DifferentRunesRule>(act(7), act(8)),
        std::make_shared<AlwaneseRule>(act(9), act(10)),
        std::make_shared<AntakianTwinsRule>(act(9), act(10)),
        std::make_shared<IncreaseSantorRule>(act(10), act(11)),
        std::make_shared<IncreaseSantorRule>(act(11), act(12)),
        std::make_shared<AntakianTwinsRule>(act(8), act(10)),
        std::make_shared<AlwaneseRule>(act(1), act(12)),
        std::make_shared<RuneFollowsImmediatelyRule>(Z, V),
    };

    return Lock(runes, std::move(rules));
}

} // namespace rune_lock

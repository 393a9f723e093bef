#include <catch2/catch_test_macros.hpp>
#include "rune_lock/fact_db.hpp"
#include "rune_lock/puzzle.hpp"
#include <memory>
#include <sstream>
#include <stdexcept>

using namespace rune_lock;

namespace {

Activation act(size_t one_based) {
    return Activation(one_based - 1);
}

Lock lock_without_rules() {
    return Lock(std::array<Rune, LOCK_SIZE>{}, {});
}

const Fact& fact_of(const FactDb& db, Position position, Activation activation) {
    auto handle = db.fact_at(position, activation);
    REQUIRE(handle.has_value());
    return *db.get(*handle);
}

} // namespace

// ============================================================================
// Construction and lookup
// ============================================================================

TEST_CASE("FactDb construction", "[fact_db]") {
    FactDb db;
    REQUIRE(db.size() == 0);
    REQUIRE(db.num_positions() == LOCK_SIZE);
    REQUIRE(db.num_activations() == LOCK_SIZE);
    REQUIRE_FALSE(db.fact_at(Position(0), act(1)).has_value());
    REQUIRE(db.get(FactHandle{0}) == nullptr);
    REQUIRE(db.givens().empty());

    REQUIRE_THROWS_AS(FactDb(13, 12), std::invalid_argument);
    REQUIRE_THROWS_AS(FactDb(12, 13), std::invalid_argument);
}

// ============================================================================
// Uniqueness propagation
// ============================================================================

TEST_CASE("FactDb assume a single value without rules", "[fact_db][uniqueness]") {
    Lock lock = lock_without_rules();
    FactDb db;

    auto result = db.integrate_and_consolidate(Fact::assumption(Position(0), act(1)), lock);
    REQUIRE(result.ok());
    REQUIRE(result.status == ConsolidationStatus::Changed);

    REQUIRE(fact_of(db, Position(0), act(1)).kind == FactKind::MustBe);
    for (size_t i = 1; i < LOCK_SIZE; ++i) {
        INFO("index " << i);
        REQUIRE(fact_of(db, Position(0), Activation(i)).kind == FactKind::CannotBe);
        REQUIRE(fact_of(db, Position(i), act(1)).kind == FactKind::CannotBe);
    }
    REQUIRE(db.count(FactKind::MustBe) == 1);
    REQUIRE(db.count(FactKind::CannotBe) == 22);
    REQUIRE(db.count(FactKind::Contradiction) == 0);

    SECTION("derived facts cite the assumption") {
        const Fact& slot = fact_of(db, Position(0), act(5));
        REQUIRE(slot.reasons.size() == 1);
        REQUIRE(slot.reasons[0] == FactReason{FactCitation{FactHandle{0}, Origin::PositionUniqueness}});

        const Fact& value = fact_of(db, Position(7), act(1));
        REQUIRE(value.reasons[0] == FactReason{FactCitation{FactHandle{0}, Origin::ActivationUniqueness}});
    }

    SECTION("statistics") {
        REQUIRE(db.stats().passes == 2);
        REQUIRE(db.stats().integrated == 23);
    }

    SECTION("fixed assignment") {
        Assignment fixed = db.fixed_assignment();
        REQUIRE(fixed.size() == 1);
        REQUIRE(fixed.position_of(act(1)) == Position(0));
    }

    SECTION("consolidate is idempotent") {
        size_t before = db.size();
        auto again = db.consolidate(lock);
        REQUIRE(again.status == ConsolidationStatus::Unchanged);
        REQUIRE(db.size() == before);
    }

    SECTION("integrating a known fact changes nothing") {
        size_t before = db.size();
        auto again = db.integrate_and_consolidate(Fact::assumption(Position(0), act(1)), lock);
        REQUIRE(again.status == ConsolidationStatus::Unchanged);
        REQUIRE(db.size() == before);
    }

    SECTION("possibilities and candidates") {
        REQUIRE(db.possibilities_for(View::of(Position(0))).empty());

        auto candidates = db.candidates_for(View::of(Position(0)));
        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0].first == Position(0));
        REQUIRE(candidates[0].second == act(1));

        auto open = db.possibilities_for(View::of(act(2)));
        REQUIRE(open.size() == LOCK_SIZE - 1);
        REQUIRE(open[0].first == Position(1));
    }

    SECTION("givens") {
        auto givens = db.givens();
        REQUIRE(givens.size() == 1);
        REQUIRE(givens[0].position == Position(0));
        REQUIRE(givens[0].activation == act(1));
        REQUIRE(givens[0].handle == FactHandle{0});
    }
}

TEST_CASE("FactDb derives MustBe from the last open cell", "[fact_db][uniqueness]") {
    Lock lock = lock_without_rules();
    FactDb db;

    for (size_t k = 2; k <= LOCK_SIZE; ++k) {
        auto result = db.integrate_and_consolidate(
            Fact::cannot_be(Position(4), act(k), {Assumed{}}), lock);
        REQUIRE(result.ok());
    }

    const Fact& forced = fact_of(db, Position(4), act(1));
    REQUIRE(forced.kind == FactKind::MustBe);
    REQUIRE(forced.reasons.size() == LOCK_SIZE - 1);
    for (const auto& reason : forced.reasons) {
        const auto* citation = std::get_if<FactCitation>(&reason);
        REQUIRE(citation != nullptr);
        REQUIRE(citation->origin == Origin::PositionUniqueness);
        REQUIRE(db.get(citation->handle)->kind == FactKind::CannotBe);
        REQUIRE(db.get(citation->handle)->position == Position(4));
    }

    // 強制された値は他の位置から除外される
    REQUIRE(fact_of(db, Position(0), act(1)).kind == FactKind::CannotBe);
}

// ============================================================================
// Contradictions
// ============================================================================

TEST_CASE("FactDb contradicting requirements", "[fact_db][contradiction]") {
    Lock lock = lock_without_rules();
    FactDb db;
    REQUIRE(db.integrate_and_consolidate(Fact::assumption(Position(0), act(1)), lock).ok());

    FactDb branch = db;
    auto result = branch.integrate_and_consolidate(Fact::assumption(Position(0), act(2)), lock);
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.status == ConsolidationStatus::Contradiction);
    REQUIRE(result.contradiction.has_value());

    const Fact* contradiction = branch.get(*result.contradiction);
    REQUIRE(contradiction->kind == FactKind::Contradiction);
    REQUIRE(contradiction->contradiction == ContradictionKind::ContradictingRequirements);
    REQUIRE(contradiction->position == Position(0));
    REQUIRE(contradiction->activation == act(2));
    REQUIRE(contradiction->reasons.size() == 2);

    // 既存の CannotBe と、新しく記録された仮定の両方を引用する
    const auto& existing = std::get<FactCitation>(contradiction->reasons[0]);
    const auto& incoming = std::get<FactCitation>(contradiction->reasons[1]);
    REQUIRE(branch.get(existing.handle)->kind == FactKind::CannotBe);
    REQUIRE(branch.get(incoming.handle)->kind == FactKind::MustBe);
    REQUIRE(branch.get(incoming.handle)->reasons == std::vector<FactReason>{Assumed{}});
    REQUIRE(branch.fact_at(Position(0), act(2)) == result.contradiction);

    SECTION("the copied-from database is untouched") {
        REQUIRE(db.count(FactKind::Contradiction) == 0);
        REQUIRE(fact_of(db, Position(0), act(2)).kind == FactKind::CannotBe);
    }

    SECTION("contradictions are absorbing") {
        size_t before = branch.size();
        auto again = branch.integrate_and_consolidate(
            Fact::cannot_be(Position(0), act(2), {Assumed{}}), lock);
        REQUIRE(again.status == ConsolidationStatus::Contradiction);
        REQUIRE(again.contradiction == result.contradiction);
        REQUIRE(branch.size() == before);

        REQUIRE(branch.consolidate(lock).status == ConsolidationStatus::Contradiction);
    }
}

TEST_CASE("FactDb no options left", "[fact_db][contradiction]") {
    // 仮定 (3, #3) から、同じルールパスで (0, #1) と (0, #2) が同時に除外される
    Lock lock(std::array<Rune, LOCK_SIZE>{},
              {std::make_shared<AlwaneseRule>(act(3), act(1)),
               std::make_shared<AlwaneseRule>(act(3), act(2))});
    FactDb db;

    for (size_t k = 3; k <= LOCK_SIZE; ++k) {
        REQUIRE(db.integrate_and_consolidate(
                      Fact::cannot_be(Position(0), act(k), {Assumed{}}), lock).ok());
    }
    REQUIRE(db.possibilities_for(View::of(Position(0))).size() == 2);

    auto result = db.integrate_and_consolidate(Fact::assumption(Position(3), act(3)), lock);
    REQUIRE(result.status == ConsolidationStatus::Contradiction);

    const Fact* contradiction = db.get(*result.contradiction);
    REQUIRE(contradiction->contradiction == ContradictionKind::NoOptionsLeft);
    REQUIRE(contradiction->position == Position(0));
    REQUIRE(contradiction->reasons.size() == LOCK_SIZE);
    REQUIRE(db.first_contradiction() == result.contradiction);
}

// ============================================================================
// Rule propagation
// ============================================================================

TEST_CASE("FactDb rule propagation on the standard lock", "[fact_db][rule]") {
    Lock lock = make_standard_lock();
    FactDb db;
    db.integrate_and_consolidate(Fact::assumption(Position(0), act(1)), lock);

    SECTION("alwanese excludes distant slots") {
        const Fact& fact = fact_of(db, Position(3), act(2));
        REQUIRE(fact.kind == FactKind::CannotBe);
        REQUIRE(fact.reasons.size() == 2);
        REQUIRE(fact.reasons[0] == FactReason{FactCitation{FactHandle{0}, Origin::RulePropagation}});
        REQUIRE(fact.reasons[1] == FactReason{RuleCitation{0}});
    }

    SECTION("rune adjacency excludes slots without the following rune") {
        const Fact& fact = fact_of(db, Position(1), act(2));
        REQUIRE(fact.kind == FactKind::CannotBe);
        REQUIRE(fact.reasons[1] == FactReason{RuleCitation{12}});
    }

    SECTION("only V slots next to #1 remain for #2") {
        for (const auto& cell : db.candidates_for(View::of(act(2)))) {
            bool allowed = cell.first == Position(2) || cell.first == Position(8);
            REQUIRE(allowed);
        }
    }
}

TEST_CASE("FactDb given that cannot satisfy a rule on its own", "[fact_db][rule]") {
    // #12 が Z のスロットにあると、次の値が存在しない
    Lock lock = make_standard_lock();
    FactDb db;

    auto result = db.integrate_and_consolidate(Fact::assumption(Position(9), act(12)), lock);
    REQUIRE(result.status == ConsolidationStatus::Contradiction);

    const Fact* contradiction = db.get(*result.contradiction);
    REQUIRE(contradiction->contradiction == ContradictionKind::ContradictingRequirements);
    REQUIRE(contradiction->position == Position(9));
    REQUIRE(contradiction->activation == act(12));
}

// ============================================================================
// Output
// ============================================================================

TEST_CASE("FactDb dump", "[fact_db]") {
    Lock lock = lock_without_rules();
    FactDb db;
    db.integrate_and_consolidate(Fact::assumption(Position(2), act(3)), lock);

    std::ostringstream os;
    db.dump(os);
    std::string text = os.str();
    REQUIRE(text.find("#12") != std::string::npos);
    REQUIRE(text.find("+F0") != std::string::npos);
    REQUIRE(text.find("-F1") != std::string::npos);
    REQUIRE(text.find(".") != std::string::npos);
}

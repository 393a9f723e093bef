#include <catch2/catch_test_macros.hpp>
#include "rune_lock/position.hpp"
#include "rune_lock/activation.hpp"
#include "rune_lock/assignment.hpp"
#include <functional>
#include <set>
#include <stdexcept>
#include <utility>

using namespace rune_lock;

namespace {

using PairSet = std::set<std::pair<size_t, size_t>>;

// 12x12 の全組について、pass に含まれる組だけが true になることを確認
void check_pairs(const PairSet& pass, const std::function<bool(Position, Position)>& test) {
    for (size_t a = 0; a < LOCK_SIZE; ++a) {
        for (size_t b = 0; b < LOCK_SIZE; ++b) {
            bool expected = pass.count({a, b}) > 0;
            INFO("pair (" << a << ", " << b << ")");
            CHECK(test(Position(a), Position(b)) == expected);
        }
    }
}

} // namespace

// ============================================================================
// Position construction
// ============================================================================

TEST_CASE("Position construction", "[position]") {
    SECTION("valid indices") {
        REQUIRE(Position(0).index() == 0);
        REQUIRE(Position(11).index() == 11);
        REQUIRE(Position(5).is_outer());
        REQUIRE_FALSE(Position(6).is_outer());
    }

    SECTION("out of range throws") {
        REQUIRE_THROWS_AS(Position(12), std::out_of_range);
    }

    SECTION("from_index checks bounds") {
        REQUIRE(Position::from_index(3).has_value());
        REQUIRE_FALSE(Position::from_index(-1).has_value());
        REQUIRE_FALSE(Position::from_index(12).has_value());
    }
}

TEST_CASE("Activation construction", "[activation]") {
    SECTION("human numbering is one based") {
        auto a = Activation::from_human(1);
        REQUIRE(a.has_value());
        REQUIRE(a->index() == 0);
        REQUIRE(a->human() == 1);
        REQUIRE_FALSE(Activation::from_human(0).has_value());
        REQUIRE_FALSE(Activation::from_human(13).has_value());
    }

    SECTION("next stops at the last activation") {
        REQUIRE(Activation(0).next() == Activation(1));
        REQUIRE_FALSE(Activation(11).next().has_value());
    }

    SECTION("out of range throws") {
        REQUIRE_THROWS_AS(Activation(12), std::out_of_range);
    }
}

// ============================================================================
// Geometric relations
// ============================================================================

TEST_CASE("Position antakian conjugates", "[position][relation]") {
    check_pairs(
        {{0, 3}, {1, 4}, {2, 5}, {3, 0}, {4, 1}, {5, 2},
         {6, 9}, {7, 10}, {8, 11}, {9, 6}, {10, 7}, {11, 8}},
        [](Position a, Position b) { return a.antakian_conjugate_of(b); });

    for (size_t i = 0; i < LOCK_SIZE; ++i) {
        Position p(i);
        REQUIRE(p.antakian_conjugate_of(p.antakian_conjugate()));
    }
}

TEST_CASE("Position alwanese of", "[position][relation]") {
    check_pairs(
        {{0, 1}, {0, 2}, {0, 7}, {0, 8}, {6, 1}, {6, 2}, {6, 7}, {6, 8},
         {1, 2}, {1, 3}, {1, 8}, {1, 9}, {7, 2}, {7, 3}, {7, 8}, {7, 9},
         {2, 3}, {2, 4}, {2, 9}, {2, 10}, {8, 3}, {8, 4}, {8, 9}, {8, 10},
         {3, 4}, {3, 5}, {3, 10}, {3, 11}, {9, 4}, {9, 5}, {9, 10}, {9, 11},
         {4, 5}, {4, 0}, {4, 11}, {4, 6}, {10, 5}, {10, 0}, {10, 11}, {10, 6},
         {5, 0}, {5, 1}, {5, 6}, {5, 7}, {11, 0}, {11, 1}, {11, 6}, {11, 7}},
        [](Position a, Position b) { return b.alwanese_of(a); });
}

TEST_CASE("Position alwanese conjugates", "[position][relation]") {
    check_pairs(
        {{0, 3}, {0, 9}, {1, 4}, {1, 10}, {2, 5}, {2, 11},
         {3, 0}, {3, 6}, {4, 1}, {4, 7}, {5, 2}, {5, 8},
         {6, 9}, {6, 3}, {7, 10}, {7, 4}, {8, 11}, {8, 5},
         {9, 6}, {9, 0}, {10, 7}, {10, 1}, {11, 8}, {11, 2}},
        [](Position a, Position b) { return a.alwanese_conjugate_of(b); });
}

TEST_CASE("Position antakian twins", "[position][relation]") {
    PairSet pass;
    for (size_t a = 0; a < LOCK_SIZE; ++a) {
        for (size_t b = 0; b < LOCK_SIZE; ++b) {
            if ((a < RING_SIZE) == (b < RING_SIZE)) {
                pass.insert({a, b});
            }
        }
    }
    check_pairs(pass, [](Position a, Position b) { return a.antakian_twins(b); });
}

TEST_CASE("Position max 0 conductive", "[position][relation]") {
    PairSet pass;
    for (size_t n = 0; n < RING_SIZE; ++n) {
        pass.insert({n, (n + 1) % 6});
        pass.insert({(n + 1) % 6, n});
        pass.insert({n + 6, (n + 1) % 6 + 6});
        pass.insert({(n + 1) % 6 + 6, n + 6});
    }
    for (size_t n = 0; n < LOCK_SIZE; ++n) {
        pass.insert({n, (n + 6) % 12});
    }
    check_pairs(pass, [](Position a, Position b) { return a.max_0_conductive(b); });
}

TEST_CASE("Position santor", "[position][relation]") {
    REQUIRE(Position(0).santor() == MAX_SANTOR);
    REQUIRE(Position(3).santor() == MIN_SANTOR);
    REQUIRE(Position(9).increases_santor(Position(6)));
    REQUIRE_FALSE(Position(6).increases_santor(Position(9)));
    REQUIRE_FALSE(Position(2).increases_santor(Position(4)));
}

// ============================================================================
// Assignment
// ============================================================================

TEST_CASE("Assignment lookups", "[assignment]") {
    Assignment assignment;
    REQUIRE(assignment.size() == 0);

    assignment.assign(Position(3), Activation(5));
    REQUIRE(assignment.activation_at(Position(3)) == Activation(5));
    REQUIRE(assignment.position_of(Activation(5)) == Position(3));
    REQUIRE(assignment.contains(Activation(5)));
    REQUIRE_FALSE(assignment.is_complete());

    SECTION("assign evicts the old pairing on both sides") {
        assignment.assign(Position(3), Activation(7));
        REQUIRE_FALSE(assignment.contains(Activation(5)));
        REQUIRE(assignment.activation_at(Position(3)) == Activation(7));

        assignment.assign(Position(4), Activation(7));
        REQUIRE_FALSE(assignment.activation_at(Position(3)).has_value());
        REQUIRE(assignment.size() == 1);
    }
}

TEST_CASE("Assignment from_pairs", "[assignment]") {
    SECTION("distinct pairs") {
        auto assignment = Assignment::from_pairs(
            {{Position(0), Activation(0)}, {Position(1), Activation(1)}});
        REQUIRE(assignment.size() == 2);
        REQUIRE(assignment.pairs().front().first == Position(0));
    }

    SECTION("duplicate activation throws") {
        REQUIRE_THROWS_AS(Assignment::from_pairs(
                              {{Position(0), Activation(2)}, {Position(1), Activation(2)}}),
                          AssignmentError);
    }

    SECTION("duplicate position throws") {
        REQUIRE_THROWS_AS(Assignment::from_pairs(
                              {{Position(4), Activation(0)}, {Position(4), Activation(1)}}),
                          AssignmentError);
    }
}

#include <catch2/catch_test_macros.hpp>
#include "lr_puzzle/tableau.hpp"

using namespace lr_puzzle;

namespace {

const Cell E = std::nullopt;

SkewTableau make_tableau(std::vector<Row> rows) {
    return SkewTableau(std::move(rows));
}

} // namespace

// ============================================================================
// SkewTableau tests
// ============================================================================

TEST_CASE("SkewTableau shapes and weight", "[tableau]") {
    SkewTableau t = make_tableau({{E, E, 1}, {E, 2}, {1}});

    SECTION("shapes") {
        REQUIRE(t.row_count() == 3);
        REQUIRE(t.outer_shape() == Partition({3, 2, 1}));
        REQUIRE(t.inner_shape() == Partition({2, 1}));
    }

    SECTION("weight and counts") {
        REQUIRE(t.weight() == std::vector<int>{2, 1});
        REQUIRE(t.count(0, 1) == 1);
        REQUIRE(t.count(1, 1) == 0);
        REQUIRE(t.count(1, 2) == 1);
        REQUIRE_THROWS_AS(t.count(3, 1), std::out_of_range);
    }

    SECTION("reading word") {
        REQUIRE(t.reading_word() == std::vector<int>{1, 2, 1});
        REQUIRE(t.is_littlewood_richardson());
    }

    SECTION("to_string") {
        REQUIRE(t.to_string() == "[[_, _, 1], [_, 2], [1]]");
        REQUIRE(SkewTableau().to_string() == "[]");
    }
}

TEST_CASE("SkewTableau rows with only empty cells", "[tableau]") {
    SkewTableau t = make_tableau({{E, 1, 1}, {E, 2}, {E}});
    REQUIRE(t.row_count() == 3);
    REQUIRE(t.inner_shape() == Partition({1, 1, 1}));
    REQUIRE(t.weight() == std::vector<int>{2, 1});
    REQUIRE(t.count(2, 1) == 0);
}

TEST_CASE("SkewTableau validation", "[tableau]") {
    SECTION("contents must be positive") {
        REQUIRE_THROWS_AS(make_tableau({{0}}), std::invalid_argument);
        REQUIRE_THROWS_AS(make_tableau({{E, -1}}), std::invalid_argument);
    }

    SECTION("empty cells form a prefix") {
        REQUIRE_THROWS_AS(make_tableau({{1, E}}), std::invalid_argument);
    }

    SECTION("rows weakly increase") {
        REQUIRE_THROWS_AS(make_tableau({{2, 1}}), std::invalid_argument);
        REQUIRE_NOTHROW(make_tableau({{1, 1, 2}}));
    }

    SECTION("columns strictly increase") {
        REQUIRE_THROWS_AS(make_tableau({{1}, {1}}), std::invalid_argument);
        REQUIRE_THROWS_AS(make_tableau({{2}, {1}}), std::invalid_argument);
        REQUIRE_NOTHROW(make_tableau({{E, 1}, {1}}));
    }

    SECTION("inner and outer shapes are partitions") {
        REQUIRE_THROWS_AS(make_tableau({{1}, {1, 2}}), std::invalid_argument);
        REQUIRE_THROWS_AS(make_tableau({{1, 1}, {E, E, 2}}), std::invalid_argument);
        REQUIRE_THROWS_AS(make_tableau({{E, 1}, {E, E}}), std::invalid_argument);
    }
}

TEST_CASE("SkewTableau Littlewood-Richardson condition", "[tableau]") {
    REQUIRE(make_tableau({{1, 1}, {2}}).is_littlewood_richardson());
    REQUIRE(make_tableau({{E, E, 1}, {E, 1}, {2}}).is_littlewood_richardson());
    REQUIRE_FALSE(make_tableau({{E, 2}, {1}}).is_littlewood_richardson());
    REQUIRE_FALSE(make_tableau({{1, 2}, {2}}).is_littlewood_richardson());
    REQUIRE(SkewTableau().is_littlewood_richardson());
}

TEST_CASE("SkewTableau construction accepts non-LR fillings", "[tableau]") {
    REQUIRE_NOTHROW(make_tableau({{E, 2}, {1}}));
    REQUIRE_NOTHROW(make_tableau({{1, 2}, {2}}));
}

TEST_CASE("SkewTableau ordering", "[tableau]") {
    SkewTableau a = make_tableau({{E, E, E}, {1, 1}, {2}});
    SkewTableau b = make_tableau({{E, E, 1}, {E, 1}, {2}});
    REQUIRE(a == make_tableau({{E, E, E}, {1, 1}, {2}}));
    REQUIRE(a != b);
    REQUIRE(a < b);
    REQUIRE_FALSE(b < a);
}

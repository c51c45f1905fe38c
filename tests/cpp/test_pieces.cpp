#include <catch2/catch_test_macros.hpp>
#include "lr_puzzle/errors.hpp"
#include "lr_puzzle/piece.hpp"
#include "lr_puzzle/piece_catalog.hpp"

using namespace lr_puzzle;

namespace {
const EdgeLabel Z = EdgeLabel::Zero;
const EdgeLabel O = EdgeLabel::One;
const EdgeLabel T = EdgeLabel::OneZero;
}

// ============================================================================
// Edge label tests
// ============================================================================

TEST_CASE("Edge label conversions", "[piece]") {
    REQUIRE(parse_edge_label("0") == Z);
    REQUIRE(parse_edge_label("1") == O);
    REQUIRE(parse_edge_label("10") == T);
    REQUIRE_THROWS_AS(parse_edge_label("2"), FormatError);

    REQUIRE(edge_label_from_char('1') == O);
    REQUIRE_THROWS_AS(edge_label_from_char('x'), FormatError);
    REQUIRE(edge_label_to_char(Z) == '0');
    REQUIRE_THROWS_AS(edge_label_to_char(T), FormatError);

    REQUIRE(std::string(to_string(T)) == "10");
    REQUIRE(std::string(to_string(Edge::SouthWest)) == "south_west");
}

// ============================================================================
// Piece tests
// ============================================================================

TEST_CASE("Delta and nabla pieces", "[piece]") {
    Piece d = Piece::delta(T, O, Z);
    Piece n = Piece::nabla(O, O, O);

    SECTION("labels by edge") {
        REQUIRE(d.is_delta());
        REQUIRE(d.label(Edge::NorthWest) == T);
        REQUIRE(d.label(Edge::NorthEast) == O);
        REQUIRE(d.label(Edge::South) == Z);
        REQUIRE(n.label(Edge::North) == O);
    }

    SECTION("edges outside the border") {
        REQUIRE_FALSE(d.has_edge(Edge::North));
        REQUIRE_THROWS_AS(d.label(Edge::SouthEast), std::out_of_range);
        REQUIRE_THROWS_AS(n.label(Edge::South), std::out_of_range);
    }

    SECTION("border and queries") {
        REQUIRE(d.border() == std::vector<EdgeLabel>{T, O, Z});
        REQUIRE_FALSE(d.is_all_ones());
        REQUIRE(n.is_all_ones());
        REQUIRE(d.zero_count() == 1);
        REQUIRE(d.to_string() == "delta(10, 1, 0)");
    }

    SECTION("triangles have no halves") {
        REQUIRE_THROWS_AS(d.north_piece(), std::logic_error);
        REQUIRE_THROWS_AS(n.south_piece(), std::logic_error);
    }
}

TEST_CASE("Rhombus pieces", "[piece]") {
    Piece north = Piece::delta(Z, Z, Z);
    Piece south = Piece::nabla(Z, T, O);
    Piece r = Piece::rhombus(north, south);

    SECTION("outer border skips the middle edge") {
        REQUIRE(r.is_rhombus());
        REQUIRE(r.border() == std::vector<EdgeLabel>{Z, Z, T, O});
        REQUIRE(r.middle_label() == Z);
        REQUIRE(r.to_string() == "rhombus(0, 0, 10, 1 / 0)");
    }

    SECTION("halves") {
        REQUIRE(r.north_piece() == north);
        REQUIRE(r.south_piece() == south);
    }

    SECTION("mismatched halves") {
        REQUIRE_THROWS_AS(Piece::rhombus(north, Piece::nabla(O, O, O)), std::invalid_argument);
        REQUIRE_THROWS_AS(Piece::rhombus(south, north), std::invalid_argument);
    }
}

// ============================================================================
// EdgeConstraints tests
// ============================================================================

TEST_CASE("EdgeConstraints admits pieces", "[catalog]") {
    EdgeConstraints known;
    Piece r = Piece::rhombus(Piece::delta(O, O, O), Piece::nabla(O, Z, T));

    REQUIRE(known.known_count() == 0);
    REQUIRE(known.admits(r));

    known.north_west = O;
    known.south_west = T;
    REQUIRE(known.known_count() == 2);
    REQUIRE(known.admits(r));

    known.at(Edge::SouthEast) = O;
    REQUIRE_FALSE(known.admits(r));

    // 三角形は south_east を持たないので照合しない
    REQUIRE(known.admits(Piece::delta(O, Z, T)));
    REQUIRE_THROWS_AS(known.at(Edge::North), std::invalid_argument);
}

// ============================================================================
// PieceCatalog tests
// ============================================================================

TEST_CASE("H-Grassmannian catalog", "[catalog]") {
    PieceCatalog catalog = PieceCatalog::h_grassmannian();

    SECTION("piece counts") {
        REQUIRE(catalog.deltas().size() == 5);
        REQUIRE(catalog.nablas().size() == 5);
        REQUIRE(catalog.rhombi().size() == 9);
        REQUIRE(catalog.triangles().size() == 4);
        REQUIRE(catalog.is_forbidden_on_boundary(T));
        REQUIRE_FALSE(catalog.is_forbidden_on_boundary(O));
    }

    SECTION("triangles on the south side never carry 10") {
        for (const auto& t : catalog.triangles()) {
            REQUIRE(t->label(Edge::South) != T);
        }
    }

    SECTION("lists are sorted by border") {
        for (size_t k = 1; k < catalog.rhombi().size(); ++k) {
            REQUIRE(catalog.rhombi()[k - 1]->border() < catalog.rhombi()[k]->border());
        }
        REQUIRE(catalog.rhombi().front()->border() == std::vector<EdgeLabel>{Z, Z, Z, Z});
        REQUIRE(catalog.rhombi().back()->border() == std::vector<EdgeLabel>{T, O, T, O});
        REQUIRE(catalog.triangles().front()->border() == std::vector<EdgeLabel>{Z, Z, Z});
        REQUIRE(catalog.triangles().back()->border() == std::vector<EdgeLabel>{T, O, Z});
    }

    SECTION("first_match picks the most degenerate piece") {
        EdgeConstraints known;
        REQUIRE(*catalog.first_match(known, false) ==
                Piece::rhombus(Piece::delta(Z, Z, Z), Piece::nabla(Z, Z, Z)));

        known.south_east = T;
        size_t checks = 0;
        PiecePtr piece = catalog.first_match(known, false, &checks);
        REQUIRE(piece->border() == std::vector<EdgeLabel>{Z, Z, T, O});
        REQUIRE(checks == 2);

        known.south_west = Z;
        REQUIRE(catalog.first_match(known, false) == nullptr);
    }

    SECTION("first_match on the diagonal") {
        EdgeConstraints known;
        known.north_west = T;
        REQUIRE(*catalog.first_match(known, true) == Piece::delta(T, O, Z));
        known.south = O;
        REQUIRE(catalog.first_match(known, true) == nullptr);
    }

    SECTION("find by exact border") {
        PiecePtr r = catalog.find(false, {O, Z, O, Z});
        REQUIRE(r != nullptr);
        REQUIRE(r->middle_label() == T);
        REQUIRE(catalog.find(false, {O, O, O, Z}) == nullptr);
        REQUIRE(catalog.find(true, {O, O, O})->is_all_ones());
        REQUIRE(catalog.find(true, {O, Z, T}) == nullptr);
    }
}

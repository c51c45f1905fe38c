#include "lr_puzzle/piece_catalog.hpp"
#include <algorithm>
#include <stdexcept>

namespace lr_puzzle {

// ============================================================================
// EdgeConstraints
// ============================================================================

std::optional<EdgeLabel>& EdgeConstraints::at(Edge edge) {
    switch (edge) {
        case Edge::NorthWest: return north_west;
        case Edge::NorthEast: return north_east;
        case Edge::SouthEast: return south_east;
        case Edge::SouthWest: return south_west;
        case Edge::South: return south;
        case Edge::North: break;
    }
    throw std::invalid_argument("a cell has no north edge");
}

const std::optional<EdgeLabel>& EdgeConstraints::at(Edge edge) const {
    return const_cast<EdgeConstraints*>(this)->at(edge);
}

size_t EdgeConstraints::known_count() const {
    size_t count = 0;
    for (const auto* field : {&north_west, &north_east, &south_east, &south_west, &south}) {
        if (field->has_value()) ++count;
    }
    return count;
}

bool EdgeConstraints::admits(const Piece& piece) const {
    for (Edge edge : piece.edges()) {
        if (edge == Edge::North) continue;  // Nabla 単体はセルにならない
        const auto& known = at(edge);
        if (known && *known != piece.label(edge)) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// PieceCatalog
// ============================================================================

namespace {

void sort_by_border(std::vector<PiecePtr>& pieces) {
    std::stable_sort(pieces.begin(), pieces.end(),
                     [](const PiecePtr& a, const PiecePtr& b) {
                         return a->border() < b->border();
                     });
}

} // namespace

PieceCatalog::PieceCatalog(std::vector<Piece> deltas, std::vector<Piece> nablas,
                           std::vector<EdgeLabel> forbidden_boundary)
    : forbidden_boundary_(std::move(forbidden_boundary)) {
    for (const auto& d : deltas) {
        if (!d.is_delta()) {
            throw std::invalid_argument("not a delta piece: " + d.to_string());
        }
        deltas_.push_back(std::make_shared<const Piece>(d));
    }
    for (const auto& n : nablas) {
        if (!n.is_nabla()) {
            throw std::invalid_argument("not a nabla piece: " + n.to_string());
        }
        nablas_.push_back(std::make_shared<const Piece>(n));
    }
    sort_by_border(deltas_);
    sort_by_border(nablas_);

    for (const auto& d : deltas_) {
        for (const auto& n : nablas_) {
            if (d->label(Edge::South) == n->label(Edge::North)) {
                rhombi_.push_back(std::make_shared<const Piece>(Piece::rhombus(*d, *n)));
            }
        }
        if (!is_forbidden_on_boundary(d->label(Edge::South))) {
            triangles_.push_back(d);
        }
    }
    sort_by_border(rhombi_);
}

PieceCatalog PieceCatalog::h_grassmannian() {
    const auto Z = EdgeLabel::Zero;
    const auto O = EdgeLabel::One;
    const auto T = EdgeLabel::OneZero;

    std::vector<Piece> deltas;
    std::vector<Piece> nablas;
    const std::vector<std::array<EdgeLabel, 3>> generators = {
        {Z, Z, Z}, {O, O, O}, {O, Z, T}
    };
    for (auto labels : generators) {
        for (int rotation = 0; rotation < 3; ++rotation) {
            // 120 度回転: (nw, ne, s) -> (s, nw, ne)
            labels = {labels[2], labels[0], labels[1]};
            Piece delta = Piece::delta(labels[0], labels[1], labels[2]);
            // 60 度回転で下向き三角形になる
            Piece nabla = Piece::nabla(labels[0], labels[1], labels[2]);
            if (std::find(deltas.begin(), deltas.end(), delta) == deltas.end()) {
                deltas.push_back(delta);
                nablas.push_back(nabla);
            }
        }
    }
    return PieceCatalog(std::move(deltas), std::move(nablas), {T});
}

PiecePtr PieceCatalog::first_match(const EdgeConstraints& known, bool diagonal,
                                   size_t* checks) const {
    for (const auto& piece : candidates(diagonal)) {
        if (checks) ++*checks;
        if (known.admits(*piece)) {
            return piece;
        }
    }
    return nullptr;
}

PiecePtr PieceCatalog::find(bool diagonal, const std::vector<EdgeLabel>& border) const {
    for (const auto& piece : candidates(diagonal)) {
        if (piece->border() == border) {
            return piece;
        }
    }
    return nullptr;
}

bool PieceCatalog::is_forbidden_on_boundary(EdgeLabel label) const {
    return std::find(forbidden_boundary_.begin(), forbidden_boundary_.end(), label) !=
           forbidden_boundary_.end();
}

} // namespace lr_puzzle

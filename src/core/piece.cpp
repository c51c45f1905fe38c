#include "lr_puzzle/piece.hpp"
#include "lr_puzzle/errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace lr_puzzle {

const char* to_string(EdgeLabel label) {
    switch (label) {
        case EdgeLabel::Zero: return "0";
        case EdgeLabel::One: return "1";
        case EdgeLabel::OneZero: return "10";
    }
    return "?";
}

const char* to_string(Edge edge) {
    switch (edge) {
        case Edge::NorthWest: return "north_west";
        case Edge::NorthEast: return "north_east";
        case Edge::SouthEast: return "south_east";
        case Edge::SouthWest: return "south_west";
        case Edge::North: return "north";
        case Edge::South: return "south";
    }
    return "?";
}

EdgeLabel parse_edge_label(const std::string& text) {
    if (text == "0") return EdgeLabel::Zero;
    if (text == "1") return EdgeLabel::One;
    if (text == "10") return EdgeLabel::OneZero;
    throw FormatError("unknown edge label: " + text);
}

EdgeLabel edge_label_from_char(char c) {
    if (c == '0') return EdgeLabel::Zero;
    if (c == '1') return EdgeLabel::One;
    throw FormatError("boundary label must be '0' or '1', got '" + std::string(1, c) + "'");
}

char edge_label_to_char(EdgeLabel label) {
    switch (label) {
        case EdgeLabel::Zero: return '0';
        case EdgeLabel::One: return '1';
        case EdgeLabel::OneZero: break;
    }
    throw FormatError("label 10 cannot appear on the boundary");
}

// ============================================================================
// Piece
// ============================================================================

Piece Piece::delta(EdgeLabel north_west, EdgeLabel north_east, EdgeLabel south) {
    return Piece(PieceKind::Delta, {north_west, north_east, south, EdgeLabel::Zero, EdgeLabel::Zero});
}

Piece Piece::nabla(EdgeLabel north, EdgeLabel south_east, EdgeLabel south_west) {
    return Piece(PieceKind::Nabla, {north, south_east, south_west, EdgeLabel::Zero, EdgeLabel::Zero});
}

Piece Piece::rhombus(const Piece& north_piece, const Piece& south_piece) {
    if (!north_piece.is_delta() || !south_piece.is_nabla()) {
        throw std::invalid_argument("rhombus needs a delta on top of a nabla");
    }
    if (north_piece.label(Edge::South) != south_piece.label(Edge::North)) {
        throw std::invalid_argument("rhombus halves disagree on the middle edge: " +
                                    north_piece.to_string() + " / " + south_piece.to_string());
    }
    return Piece(PieceKind::Rhombus, {
        north_piece.label(Edge::NorthWest),
        north_piece.label(Edge::NorthEast),
        south_piece.label(Edge::SouthEast),
        south_piece.label(Edge::SouthWest),
        north_piece.label(Edge::South)
    });
}

const std::vector<Edge>& Piece::edges() const {
    static const std::vector<Edge> delta_edges = {Edge::NorthWest, Edge::NorthEast, Edge::South};
    static const std::vector<Edge> nabla_edges = {Edge::North, Edge::SouthEast, Edge::SouthWest};
    static const std::vector<Edge> rhombus_edges = {
        Edge::NorthWest, Edge::NorthEast, Edge::SouthEast, Edge::SouthWest};
    switch (kind_) {
        case PieceKind::Delta: return delta_edges;
        case PieceKind::Nabla: return nabla_edges;
        case PieceKind::Rhombus: break;
    }
    return rhombus_edges;
}

bool Piece::has_edge(Edge edge) const {
    const auto& e = edges();
    return std::find(e.begin(), e.end(), edge) != e.end();
}

size_t Piece::slot(Edge edge) const {
    const auto& e = edges();
    auto it = std::find(e.begin(), e.end(), edge);
    if (it == e.end()) {
        throw std::out_of_range(std::string("piece has no ") + lr_puzzle::to_string(edge) + " edge");
    }
    return static_cast<size_t>(it - e.begin());
}

EdgeLabel Piece::label(Edge edge) const {
    return labels_[slot(edge)];
}

std::vector<EdgeLabel> Piece::border() const {
    size_t count = edges().size();
    return std::vector<EdgeLabel>(labels_.begin(), labels_.begin() + count);
}

bool Piece::is_all_ones() const {
    for (auto l : border()) {
        if (l != EdgeLabel::One) return false;
    }
    return kind_ != PieceKind::Rhombus || middle_label() == EdgeLabel::One;
}

Piece Piece::north_piece() const {
    if (!is_rhombus()) {
        throw std::logic_error("north_piece() on a " + to_string());
    }
    return delta(labels_[0], labels_[1], labels_[4]);
}

Piece Piece::south_piece() const {
    if (!is_rhombus()) {
        throw std::logic_error("south_piece() on a " + to_string());
    }
    return nabla(labels_[4], labels_[2], labels_[3]);
}

size_t Piece::zero_count() const {
    auto b = border();
    return static_cast<size_t>(std::count(b.begin(), b.end(), EdgeLabel::Zero));
}

std::string Piece::to_string() const {
    std::string result;
    switch (kind_) {
        case PieceKind::Delta: result = "delta("; break;
        case PieceKind::Nabla: result = "nabla("; break;
        case PieceKind::Rhombus: result = "rhombus("; break;
    }
    auto b = border();
    for (size_t k = 0; k < b.size(); ++k) {
        if (k > 0) result += ", ";
        result += lr_puzzle::to_string(b[k]);
    }
    if (is_rhombus()) {
        result += " / ";
        result += lr_puzzle::to_string(middle_label());
    }
    result += ")";
    return result;
}

} // namespace lr_puzzle

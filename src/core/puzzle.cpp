#include "lr_puzzle/puzzle.hpp"
#include "lr_puzzle/errors.hpp"
#include <stdexcept>

namespace lr_puzzle {

PuzzleFilling::PuzzleFilling(std::string north_west_labels, std::string north_east_labels)
    : n_(static_cast<int>(north_west_labels.size()))
    , north_west_(std::move(north_west_labels))
    , north_east_(std::move(north_east_labels))
    , kink_{1, n_} {
    if (north_west_.size() != north_east_.size()) {
        throw FormatError("boundary words differ in length: \"" + north_west_ +
                          "\" vs \"" + north_east_ + "\"");
    }
    for (char c : north_west_) edge_label_from_char(c);
    for (char c : north_east_) edge_label_from_char(c);
    cells_.resize(static_cast<size_t>(n_) * static_cast<size_t>(n_ + 1) / 2);
}

size_t PuzzleFilling::index(int i, int j) const {
    if (!contains(i, j)) {
        throw std::out_of_range("cell (" + std::to_string(i) + ", " + std::to_string(j) +
                                ") is outside a puzzle of size " + std::to_string(n_));
    }
    return static_cast<size_t>(j - 1) * static_cast<size_t>(j) / 2 + static_cast<size_t>(i - 1);
}

const Piece& PuzzleFilling::at(int i, int j) const {
    const auto& piece = cells_[index(i, j)];
    if (!piece) {
        throw std::out_of_range("cell (" + std::to_string(i) + ", " + std::to_string(j) +
                                ") is empty");
    }
    return *piece;
}

bool PuzzleFilling::has_piece(int i, int j) const {
    return contains(i, j) && cells_[index(i, j)] != nullptr;
}

void PuzzleFilling::set(int i, int j, PiecePtr piece) {
    size_t idx = index(i, j);
    if (!piece) {
        throw std::invalid_argument("cannot place a null piece");
    }
    bool diagonal = (i == j);
    if (diagonal && !piece->is_delta()) {
        throw std::invalid_argument("diagonal cell (" + std::to_string(i) + ", " +
                                    std::to_string(j) + ") needs a delta, got " +
                                    piece->to_string());
    }
    if (!diagonal && !piece->is_rhombus()) {
        throw std::invalid_argument("cell (" + std::to_string(i) + ", " + std::to_string(j) +
                                    ") needs a rhombus, got " + piece->to_string());
    }
    cells_[idx] = std::move(piece);
}

std::string PuzzleFilling::south_labels() const {
    std::string result;
    result.reserve(static_cast<size_t>(n_));
    for (int i = 1; i <= n_; ++i) {
        result += edge_label_to_char(at(i, i).label(Edge::South));
    }
    return result;
}

bool PuzzleFilling::is_complete() const {
    for (const auto& piece : cells_) {
        if (!piece) return false;
    }
    return true;
}

bool PuzzleFilling::is_consistent() const {
    if (!is_complete()) {
        return false;
    }
    for (int j = 1; j <= n_; ++j) {
        for (int i = 1; i <= j; ++i) {
            const Piece& piece = at(i, j);
            if (i == 1 &&
                piece.label(Edge::NorthWest) != edge_label_from_char(north_west_[j - 1])) {
                return false;
            }
            if (j == n_ &&
                piece.label(Edge::NorthEast) != edge_label_from_char(north_east_[i - 1])) {
                return false;
            }
            if (i == j && piece.label(Edge::South) == EdgeLabel::OneZero) {
                return false;
            }
            // 北東の隣 (i, j+1) と南東の隣 (i+1, j) だけ見れば全ての共有辺を覆う
            if (j < n_ && piece.label(Edge::NorthEast) != at(i, j + 1).label(Edge::SouthWest)) {
                return false;
            }
            if (i < j && piece.label(Edge::SouthEast) != at(i + 1, j).label(Edge::NorthWest)) {
                return false;
            }
        }
    }
    return true;
}

// ============================================================================
// Kink
// ============================================================================

EdgeLabel PuzzleFilling::north_west_label_of_kink() const {
    if (is_completed()) {
        throw std::logic_error("puzzle is already filled");
    }
    if (kink_.i == 1) {
        return edge_label_from_char(north_west_[kink_.j - 1]);
    }
    return at(kink_.i - 1, kink_.j).label(Edge::SouthEast);
}

EdgeLabel PuzzleFilling::north_east_label_of_kink() const {
    if (is_completed()) {
        throw std::logic_error("puzzle is already filled");
    }
    if (kink_.j == n_) {
        return edge_label_from_char(north_east_[kink_.i - 1]);
    }
    return at(kink_.i, kink_.j + 1).label(Edge::SouthWest);
}

void PuzzleFilling::add_piece(PiecePtr piece) {
    if (is_completed()) {
        throw std::logic_error("puzzle is already filled");
    }
    set(kink_.i, kink_.j, std::move(piece));
    if (kink_.on_diagonal()) {
        kink_ = Coord{1, kink_.j - 1};
    } else {
        ++kink_.i;
    }
}

void PuzzleFilling::remove_last_piece() {
    if (kink_ == Coord{1, n_}) {
        throw std::logic_error("no piece to remove");
    }
    if (kink_.i == 1) {
        kink_ = Coord{kink_.j + 1, kink_.j + 1};
    } else {
        --kink_.i;
    }
    cells_[index(kink_.i, kink_.j)].reset();
}

bool PuzzleFilling::operator==(const PuzzleFilling& other) const {
    if (n_ != other.n_ || north_west_ != other.north_west_ ||
        north_east_ != other.north_east_) {
        return false;
    }
    for (size_t k = 0; k < cells_.size(); ++k) {
        const auto& a = cells_[k];
        const auto& b = other.cells_[k];
        if (!a || !b) {
            if (a || b) return false;
            continue;
        }
        if (*a != *b) return false;
    }
    return true;
}

} // namespace lr_puzzle

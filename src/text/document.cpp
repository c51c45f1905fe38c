#include "lr_puzzle/text/document.hpp"
#include <stdexcept>

namespace lr_puzzle {
namespace text {

namespace {

std::runtime_error error_at(int line, const std::string& message) {
    return std::runtime_error("line " + std::to_string(line) + ": " + message);
}

std::string cell_name(int i, int j) {
    return "(" + std::to_string(i) + ", " + std::to_string(j) + ")";
}

} // namespace

SkewTableau TableauDecl::to_tableau() const {
    try {
        return SkewTableau(rows);
    } catch (const std::invalid_argument& e) {
        throw error_at(line, std::string("invalid tableau: ") + e.what());
    }
}

PuzzleFilling PuzzleDecl::to_puzzle(const PieceCatalog& catalog) const {
    std::optional<PuzzleFilling> puzzle;
    try {
        puzzle.emplace(north_west, north_east);
    } catch (const std::invalid_argument& e) {
        throw error_at(line, e.what());
    }

    for (const auto& cell : cells) {
        if (!puzzle->contains(cell.i, cell.j)) {
            throw error_at(cell.line, "cell " + cell_name(cell.i, cell.j) +
                                      " is outside a puzzle of size " +
                                      std::to_string(puzzle->size()));
        }
        if (puzzle->has_piece(cell.i, cell.j)) {
            throw error_at(cell.line, "cell " + cell_name(cell.i, cell.j) + " is given twice");
        }
        bool diagonal = (cell.i == cell.j);
        size_t expected = diagonal ? 3 : 4;
        if (cell.labels.size() != expected) {
            throw error_at(cell.line, "cell " + cell_name(cell.i, cell.j) + " needs " +
                                      std::to_string(expected) + " labels, got " +
                                      std::to_string(cell.labels.size()));
        }
        PiecePtr piece = catalog.find(diagonal, cell.labels);
        if (!piece) {
            throw error_at(cell.line, "no piece has the labels of cell " +
                                      cell_name(cell.i, cell.j));
        }
        puzzle->set(cell.i, cell.j, std::move(piece));
    }

    for (int j = puzzle->size(); j >= 1; --j) {
        for (int i = 1; i <= j; ++i) {
            if (!puzzle->has_piece(i, j)) {
                throw error_at(line, "cell " + cell_name(i, j) + " is missing");
            }
        }
    }
    if (!puzzle->is_consistent()) {
        throw error_at(line, "adjacent pieces or boundary words disagree");
    }
    return std::move(*puzzle);
}

void write_puzzle(std::ostream& out, const PuzzleFilling& puzzle) {
    out << "puzzle \"" << puzzle.north_west_labels() << "\" \""
        << puzzle.north_east_labels() << "\" {\n";
    for (int j = puzzle.size(); j >= 1; --j) {
        for (int i = 1; i <= j; ++i) {
            if (!puzzle.has_piece(i, j)) continue;
            out << "  " << cell_name(i, j);
            for (EdgeLabel label : puzzle.at(i, j).border()) {
                out << " " << to_string(label);
            }
            out << ";\n";
        }
    }
    out << "}\n";
}

} // namespace text
} // namespace lr_puzzle

#include "lr_puzzle/bijection.hpp"
#include "lr_puzzle/abacus.hpp"
#include "lr_puzzle/errors.hpp"
#include <algorithm>
#include <functional>
#include <iostream>
#include <sstream>

namespace lr_puzzle {

namespace {

std::string coord_string(int i, int j) {
    return "(" + std::to_string(i) + ", " + std::to_string(j) + ")";
}

std::string values_string(const std::vector<int>& values) {
    std::ostringstream oss;
    oss << "[";
    for (size_t k = 0; k < values.size(); ++k) {
        if (k > 0) oss << ", ";
        oss << values[k];
    }
    oss << "]";
    return oss.str();
}

void require_complete(const PuzzleFilling& puzzle) {
    if (!puzzle.is_complete()) {
        throw PreconditionError("puzzle is not completely filled");
    }
}

/**
 * @brief 全セルの既知の辺ラベル
 *
 * 共有辺は両側のセルに同じラベルを書く。矛盾する書き込みと
 * グリッド外への書き込みは NoCandidateError（タブローが不正）。
 */
class ConstraintGrid {
public:
    explicit ConstraintGrid(int n)
        : n_(n), cells_(static_cast<size_t>(n) * static_cast<size_t>(n + 1) / 2) {}

    void set(int i, int j, Edge edge, EdgeLabel label) {
        assign(i, j, edge, label);
        switch (edge) {
            case Edge::NorthEast:
                if (j < n_) assign(i, j + 1, Edge::SouthWest, label);
                break;
            case Edge::SouthWest:
                if (i < j) assign(i, j - 1, Edge::NorthEast, label);
                break;
            case Edge::NorthWest:
                if (i > 1) assign(i - 1, j, Edge::SouthEast, label);
                break;
            case Edge::SouthEast:
                if (i < j) assign(i + 1, j, Edge::NorthWest, label);
                break;
            default:
                break;
        }
    }

    const EdgeConstraints& at(int i, int j) const {
        return const_cast<ConstraintGrid*>(this)->cell(i, j);
    }

    size_t known_edges() const {
        size_t total = 0;
        for (const auto& c : cells_) total += c.known_count();
        return total;
    }

private:
    EdgeConstraints& cell(int i, int j) {
        if (!(1 <= i && i <= j && j <= n_)) {
            throw NoCandidateError("edge constraint outside the grid at " + coord_string(i, j));
        }
        return cells_[static_cast<size_t>(j - 1) * static_cast<size_t>(j) / 2 +
                      static_cast<size_t>(i - 1)];
    }

    void assign(int i, int j, Edge edge, EdgeLabel label) {
        auto& slot = cell(i, j).at(edge);
        if (slot && *slot != label) {
            throw NoCandidateError(std::string("conflicting ") + to_string(edge) + " label at " +
                                   coord_string(i, j) + ": " + to_string(*slot) + " vs " +
                                   to_string(label));
        }
        slot = label;
    }

    int n_;
    std::vector<EdgeConstraints> cells_;
};

std::string reversed(std::string s) {
    std::reverse(s.begin(), s.end());
    return s;
}

} // namespace

Bijection::Bijection(std::shared_ptr<const PieceCatalog> catalog)
    : catalog_(std::move(catalog)) {}

const PieceCatalog& Bijection::catalog() const {
    if (!catalog_) {
        throw std::invalid_argument("no piece catalog");
    }
    return *catalog_;
}

// ============================================================================
// Puzzle -> tableau
// ============================================================================

std::vector<int> Bijection::trace_row(const PuzzleFilling& puzzle, int coord) {
    const int n = puzzle.size();
    if (coord < 1 || coord > n) {
        throw PreconditionError("boundary position " + std::to_string(coord) +
                                " is outside a puzzle of size " + std::to_string(n));
    }
    if (puzzle.north_east_labels()[coord - 1] != '1') {
        throw PreconditionError("north-east label at position " + std::to_string(coord) +
                                " is not '1'");
    }
    require_complete(puzzle);

    static const Piece carrier =
        Piece::delta(EdgeLabel::OneZero, EdgeLabel::One, EdgeLabel::Zero);

    int i = coord;
    int j = n;
    bool moving_west = true;
    std::vector<int> row;

    while (true) {
        if (!puzzle.contains(i, j)) {
            throw ConsistencyError("trace from position " + std::to_string(coord) +
                                   " left the grid at " + coord_string(i, j));
        }
        ++stats_.trace_steps;

        if (moving_west) {
            const Piece& piece = puzzle.at(i, j);
            Piece delta = piece.is_delta() ? piece : piece.north_piece();
            if (delta.is_all_ones()) {
                moving_west = false;
                for (int& value : row) ++value;
            } else if (delta == carrier) {
                row.insert(row.begin(), 0);
                --i;
                --j;
            } else {
                throw ConsistencyError("unexpected " + delta.to_string() + " at " +
                                       coord_string(i, j) + " while tracing west");
            }
        } else {
            if (j - i < 1) {
                break;
            }
            if (puzzle.at(i, j).south_piece().is_all_ones()) {
                moving_west = true;
            }
            --j;
        }
    }

    ++stats_.traced_rows;
    if (verbose_) {
        std::cerr << "% [verbose] trace_row(" << coord << "): " << values_string(row) << "\n";
    }
    return row;
}

SkewTableau Bijection::puzzle_to_tableau(const PuzzleFilling& puzzle) {
    require_complete(puzzle);

    const std::string& ne = puzzle.north_east_labels();
    Partition inner = abacus_to_partition(puzzle.south_labels());
    size_t k = static_cast<size_t>(std::count(ne.begin(), ne.end(), '1'));

    std::vector<Row> rows;
    for (int i = 0; i < puzzle.size(); ++i) {
        if (ne[i] != '1') continue;
        --k;
        Row row(static_cast<size_t>(inner[k]), std::nullopt);
        for (int value : trace_row(puzzle, i + 1)) {
            row.emplace_back(value);
        }
        rows.insert(rows.begin(), std::move(row));
    }

    rows.erase(std::remove_if(rows.begin(), rows.end(),
                              [](const Row& row) { return row.empty(); }),
               rows.end());

    SkewTableau tableau(std::move(rows));
    if (verbose_) {
        std::cerr << "% [verbose] puzzle_to_tableau: " << tableau.to_string() << "\n";
    }
    return tableau;
}

// ============================================================================
// Tableau -> puzzle
// ============================================================================

int Bijection::minimum_size(const SkewTableau& tableau) {
    const int L = static_cast<int>(tableau.row_count());
    std::vector<int> weight = tableau.weight();
    int w0 = weight.empty() ? 0 : weight[0];
    return std::max(w0 + L, tableau.outer_shape()[0] + L);
}

BluePositions Bijection::blue_positions(const SkewTableau& tableau,
                                        const std::string& lam,
                                        const std::string& nu) const {
    const size_t L = tableau.row_count();
    const int n = static_cast<int>(lam.size());

    std::vector<int> chosen_rows;
    std::vector<int> chosen_cols;
    for (size_t p = 0; p < lam.size(); ++p) {
        if (lam[p] == '1') chosen_rows.push_back(static_cast<int>(p) + 1);
    }
    for (size_t p = 0; p < nu.size(); ++p) {
        if (nu[p] == '1') chosen_cols.push_back(static_cast<int>(p) + 1);
    }
    if (chosen_rows.size() < L || chosen_cols.size() < L) {
        throw PreconditionError("boundary words have fewer '1' labels than the tableau has rows");
    }

    BluePositions blue;
    for (size_t col = 0; col < L; ++col) {
        std::vector<int> next_rows;
        std::vector<int> next_cols;
        for (size_t row = 0; row <= col; ++row) {
            int j = chosen_rows[row];
            int i = chosen_cols[col - row];
            blue.delta.insert(Coord{i, j});

            int k = tableau.count(L - col + row - 1, static_cast<int>(row) + 1);
            // j + k + 1 == n + 1 は北東辺の外から入る経路の起点
            if (j + k + 1 <= n) {
                blue.nabla.insert(Coord{i + k, j + k + 1});
            }
            next_cols.push_back(i + k);
            next_rows.push_back(j + k + 1);
        }
        std::sort(next_rows.begin(), next_rows.end());
        std::sort(next_cols.begin(), next_cols.end());
        std::copy(next_rows.begin(), next_rows.end(), chosen_rows.begin());
        std::copy(next_cols.begin(), next_cols.end(), chosen_cols.begin());
    }
    return blue;
}

PuzzleFilling Bijection::tableau_to_puzzle(const SkewTableau& tableau, std::optional<int> size) {
    if (!catalog_) {
        throw std::invalid_argument("tableau_to_puzzle needs a piece catalog");
    }

    const size_t L = tableau.row_count();
    std::vector<int> weight = tableau.weight();
    for (size_t v = 1; v < weight.size(); ++v) {
        if (weight[v] > weight[v - 1]) {
            throw PreconditionError("weight " + values_string(weight) + " is not a partition");
        }
    }
    if (weight.size() > L) {
        throw PreconditionError("weight " + values_string(weight) + " has more parts than the " +
                                std::to_string(L) + " rows of the tableau");
    }

    // ===== サイズの決定 =====
    const int required = minimum_size(tableau);
    if (size && *size < required) {
        throw SizeError("puzzle size " + std::to_string(*size) + " is smaller than the required " +
                        std::to_string(required));
    }
    const int n = size ? *size : required;
    const size_t width = static_cast<size_t>(n);

    // ===== 境界ワード =====
    weight.resize(L, 0);
    std::string lam = reversed(partition_to_abacus(weight, width));

    Partition outer = tableau.outer_shape();
    std::vector<int> complement;
    for (size_t r = 0; r < L; ++r) {
        complement.push_back(n - static_cast<int>(L) - outer[r]);
    }
    std::sort(complement.begin(), complement.end(), std::greater<int>());
    std::string mu = reversed(partition_to_abacus(complement, width));

    std::string nu = partition_to_abacus(tableau.inner_shape().padded(L), width);

    if (verbose_) {
        std::cerr << "% [verbose] tableau_to_puzzle: size=" << n << " lam=" << lam
                  << " mu=" << mu << " nu=" << nu << "\n";
    }

    // ===== 青い三角形 =====
    BluePositions blue = blue_positions(tableau, lam, nu);
    stats_.delta_blue_count += blue.delta.size();
    stats_.nabla_blue_count += blue.nabla.size();
    auto is_delta_blue = [&](int i, int j) { return blue.delta.count(Coord{i, j}) > 0; };
    auto is_nabla_blue = [&](int i, int j) { return blue.nabla.count(Coord{i, j}) > 0; };

    // ===== 辺ラベルの塗り分け =====
    ConstraintGrid grid(n);
    for (const Coord& c : blue.delta) {
        grid.set(c.i, c.j, Edge::NorthWest, EdgeLabel::One);
        grid.set(c.i, c.j, Edge::NorthEast, EdgeLabel::One);
        for (int x = c.i - 1; x >= 1 && !is_nabla_blue(x, c.j); --x) {
            grid.set(x, c.j, Edge::NorthWest, EdgeLabel::One);
        }
        for (int x = c.i, y = c.j; y + 1 <= n && !is_nabla_blue(x, y + 1); ++x, ++y) {
            grid.set(x + 1, y + 1, Edge::NorthWest, EdgeLabel::OneZero);
            grid.set(x + 1, y + 1, Edge::NorthEast, EdgeLabel::One);
        }
    }

    // (i, j0) の北東に続く南西辺を次の delta まで 10 で塗る
    auto run_up = [&](int i, int j0) {
        if (is_delta_blue(i, j0)) return;
        for (int y = j0 + 1; y <= n; ++y) {
            grid.set(i, y, Edge::SouthWest, EdgeLabel::OneZero);
            if (is_delta_blue(i, y)) break;
        }
    };
    for (const Coord& c : blue.nabla) {
        grid.set(c.i, c.j, Edge::SouthEast, EdgeLabel::One);
        grid.set(c.i, c.j, Edge::SouthWest, EdgeLabel::One);
        run_up(c.i, c.j);
    }
    for (int i = 1; i <= n; ++i) {
        if (nu[i - 1] == '1') run_up(i, i);
    }

    for (int j = 1; j <= n; ++j) {
        grid.set(1, j, Edge::NorthWest, edge_label_from_char(lam[j - 1]));
    }
    for (int i = 1; i <= n; ++i) {
        grid.set(i, n, Edge::NorthEast, edge_label_from_char(mu[i - 1]));
        grid.set(i, i, Edge::South, edge_label_from_char(nu[i - 1]));
    }
    stats_.constrained_edges += grid.known_edges();

    // ===== ピースの選択 =====
    PuzzleFilling puzzle(lam, mu);
    for (int j = n; j >= 1; --j) {
        for (int i = 1; i <= j; ++i) {
            bool diagonal = (i == j);
            PiecePtr piece = catalog_->first_match(grid.at(i, j), diagonal,
                                                   &stats_.candidate_checks);
            if (!piece) {
                throw NoCandidateError("no " + std::string(diagonal ? "triangle" : "rhombus") +
                                       " matches the known edges at " + coord_string(i, j));
            }
            puzzle.set(i, j, std::move(piece));
            ++stats_.filled_cells;
        }
    }

    if (verbose_) {
        std::cerr << "% [verbose] tableau_to_puzzle done: " << blue.delta.size()
                  << " delta anchors, " << blue.nabla.size() << " nabla anchors\n";
    }
    return puzzle;
}

// ============================================================================
// Free functions
// ============================================================================

SkewTableau puzzle_to_tableau(const PuzzleFilling& puzzle) {
    Bijection bijection(nullptr);
    return bijection.puzzle_to_tableau(puzzle);
}

PuzzleFilling tableau_to_puzzle(const SkewTableau& tableau,
                                std::shared_ptr<const PieceCatalog> catalog,
                                std::optional<int> size) {
    Bijection bijection(std::move(catalog));
    return bijection.tableau_to_puzzle(tableau, size);
}

} // namespace lr_puzzle

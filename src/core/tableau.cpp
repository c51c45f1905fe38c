#include "lr_puzzle/tableau.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace lr_puzzle {

SkewTableau::SkewTableau(std::vector<Row> rows) : rows_(std::move(rows)) {
    validate();
}

void SkewTableau::validate() const {
    size_t prev_inner = 0;
    size_t prev_outer = 0;
    for (size_t r = 0; r < rows_.size(); ++r) {
        const Row& row = rows_[r];
        size_t inner = 0;
        while (inner < row.size() && !row[inner]) {
            ++inner;
        }
        for (size_t c = inner; c < row.size(); ++c) {
            if (!row[c]) {
                throw std::invalid_argument("row " + std::to_string(r) +
                                            ": empty cell after a filled cell");
            }
            if (*row[c] <= 0) {
                throw std::invalid_argument("row " + std::to_string(r) +
                                            ": contents must be positive, got " +
                                            std::to_string(*row[c]));
            }
            if (c > inner && *row[c] < *row[c - 1]) {
                throw std::invalid_argument("row " + std::to_string(r) +
                                            " is not weakly increasing");
            }
        }
        if (r > 0) {
            if (inner > prev_inner) {
                throw std::invalid_argument("inner shape is not a partition at row " +
                                            std::to_string(r));
            }
            if (row.size() > prev_outer) {
                throw std::invalid_argument("outer shape is not a partition at row " +
                                            std::to_string(r));
            }
            // 上の行は row.size() <= prev_outer なので列 c は必ず存在する
            const Row& above = rows_[r - 1];
            for (size_t c = inner; c < row.size(); ++c) {
                if (above[c] && *above[c] >= *row[c]) {
                    throw std::invalid_argument("column " + std::to_string(c) +
                                                " is not strictly increasing at row " +
                                                std::to_string(r));
                }
            }
        }
        prev_inner = inner;
        prev_outer = row.size();
    }
}

Partition SkewTableau::outer_shape() const {
    std::vector<Partition::value_type> parts;
    parts.reserve(rows_.size());
    for (const auto& row : rows_) {
        parts.push_back(static_cast<Partition::value_type>(row.size()));
    }
    return Partition(std::move(parts));
}

Partition SkewTableau::inner_shape() const {
    std::vector<Partition::value_type> parts;
    parts.reserve(rows_.size());
    for (const auto& row : rows_) {
        auto first = std::find_if(row.begin(), row.end(),
                                  [](const Cell& cell) { return cell.has_value(); });
        parts.push_back(static_cast<Partition::value_type>(first - row.begin()));
    }
    return Partition(std::move(parts));
}

std::vector<int> SkewTableau::weight() const {
    std::vector<int> result;
    for (const auto& row : rows_) {
        for (const auto& cell : row) {
            if (!cell) continue;
            if (static_cast<size_t>(*cell) > result.size()) {
                result.resize(static_cast<size_t>(*cell), 0);
            }
            ++result[*cell - 1];
        }
    }
    return result;
}

int SkewTableau::count(size_t r, int value) const {
    if (r >= rows_.size()) {
        throw std::out_of_range("tableau has no row " + std::to_string(r));
    }
    return static_cast<int>(std::count(rows_[r].begin(), rows_[r].end(), Cell(value)));
}

std::vector<int> SkewTableau::reading_word() const {
    std::vector<int> word;
    for (const auto& row : rows_) {
        for (auto it = row.rbegin(); it != row.rend(); ++it) {
            if (*it) word.push_back(**it);
        }
    }
    return word;
}

bool SkewTableau::is_littlewood_richardson() const {
    std::vector<int> seen;
    for (int value : reading_word()) {
        if (static_cast<size_t>(value) > seen.size()) {
            seen.resize(static_cast<size_t>(value), 0);
        }
        ++seen[value - 1];
        if (value > 1 && seen[value - 1] > seen[value - 2]) {
            return false;
        }
    }
    return true;
}

std::string SkewTableau::to_string() const {
    std::ostringstream oss;
    oss << "[";
    for (size_t r = 0; r < rows_.size(); ++r) {
        if (r > 0) oss << ", ";
        oss << "[";
        for (size_t c = 0; c < rows_[r].size(); ++c) {
            if (c > 0) oss << ", ";
            if (rows_[r][c]) {
                oss << *rows_[r][c];
            } else {
                oss << "_";
            }
        }
        oss << "]";
    }
    oss << "]";
    return oss.str();
}

} // namespace lr_puzzle

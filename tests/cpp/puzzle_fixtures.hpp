/**
 * @file puzzle_fixtures.hpp
 * @brief テスト用のパズル列挙（キンク順の深さ優先探索）
 */
#ifndef LR_PUZZLE_TESTS_PUZZLE_FIXTURES_HPP
#define LR_PUZZLE_TESTS_PUZZLE_FIXTURES_HPP

#include "lr_puzzle/piece_catalog.hpp"
#include "lr_puzzle/puzzle.hpp"
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace lr_puzzle {
namespace testing {

inline std::shared_ptr<const PieceCatalog> h_catalog() {
    static const auto catalog =
        std::make_shared<const PieceCatalog>(PieceCatalog::h_grassmannian());
    return catalog;
}

inline void fill_from_kink(PuzzleFilling& puzzle, const PieceCatalog& catalog,
                           std::vector<PuzzleFilling>& out) {
    if (puzzle.is_completed()) {
        out.push_back(puzzle);
        return;
    }
    EdgeConstraints known;
    known.north_west = puzzle.north_west_label_of_kink();
    known.north_east = puzzle.north_east_label_of_kink();
    for (const auto& piece : catalog.candidates(puzzle.kink().on_diagonal())) {
        if (!known.admits(*piece)) continue;
        puzzle.add_piece(piece);
        fill_from_kink(puzzle, catalog, out);
        puzzle.remove_last_piece();
    }
}

/**
 * @brief 境界ワードを持つ全てのパズル
 */
inline std::vector<PuzzleFilling> solve_puzzles(const std::string& north_west,
                                                const std::string& north_east) {
    std::vector<PuzzleFilling> result;
    PuzzleFilling puzzle(north_west, north_east);
    fill_from_kink(puzzle, *h_catalog(), result);
    return result;
}

/**
 * @brief 長さ n の 0/1 ワード全て
 */
inline std::vector<std::string> binary_words(int n) {
    std::vector<std::string> words;
    for (unsigned bits = 0; bits < (1u << n); ++bits) {
        std::string word;
        for (int k = n - 1; k >= 0; --k) {
            word += ((bits >> k) & 1u) ? '1' : '0';
        }
        words.push_back(word);
    }
    return words;
}

/**
 * @brief サイズ n の全てのパズル（'1' の個数が等しい境界の組すべて）
 */
inline std::vector<PuzzleFilling> all_puzzles(int n) {
    std::vector<PuzzleFilling> result;
    auto words = binary_words(n);
    for (const auto& nw : words) {
        for (const auto& ne : words) {
            if (std::count(nw.begin(), nw.end(), '1') != std::count(ne.begin(), ne.end(), '1')) {
                continue;
            }
            for (auto& puzzle : solve_puzzles(nw, ne)) {
                result.push_back(std::move(puzzle));
            }
        }
    }
    return result;
}

} // namespace testing
} // namespace lr_puzzle

#endif // LR_PUZZLE_TESTS_PUZZLE_FIXTURES_HPP

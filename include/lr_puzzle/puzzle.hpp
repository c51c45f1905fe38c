/**
 * @file puzzle.hpp
 * @brief パズルの充填（三角形グリッド上のピース配置）
 */
#ifndef LR_PUZZLE_PUZZLE_HPP
#define LR_PUZZLE_PUZZLE_HPP

#include "lr_puzzle/piece.hpp"
#include <string>
#include <vector>
#include <utility>

namespace lr_puzzle {

/**
 * @brief グリッド座標 (i, j), 1 <= i <= j <= n
 *
 * j が等しいセルは北東辺に平行な帯をなす。(i, n) は北東辺、
 * (1, j) は北西辺、(i, i) は南辺に接する三角形セル。
 */
struct Coord {
    int i;
    int j;

    bool on_diagonal() const { return i == j; }

    bool operator==(const Coord& other) const { return i == other.i && j == other.j; }
    bool operator!=(const Coord& other) const { return !(*this == other); }
    bool operator<(const Coord& other) const {
        return i != other.i ? i < other.i : j < other.j;
    }
};

/**
 * @brief サイズ n のパズル充填
 *
 * 境界ワードの読み方:
 * - north_west_labels()[j-1]: (1, j) の北西辺（下から上）
 * - north_east_labels()[i-1]: (i, n) の北東辺（上から下）
 * - south_labels()[i-1]: (i, i) の南辺（左から右）
 *
 * 隣接するピースの共有辺ラベルが一致することは呼び出し側の責任
 * （is_consistent() で確認できる）。
 */
class PuzzleFilling {
public:
    /**
     * @brief 境界ワードから空のパズルを作成
     * @param north_west_labels 北西辺のワード
     * @param north_east_labels 北東辺のワード
     * @throws FormatError ワードの長さが異なる、または '0'/'1' 以外を含む場合
     */
    PuzzleFilling(std::string north_west_labels, std::string north_east_labels);

    /**
     * @brief パズルのサイズ n
     */
    int size() const { return n_; }

    /**
     * @brief 座標がグリッド内か
     */
    bool contains(int i, int j) const { return 1 <= i && i <= j && j <= n_; }

    /**
     * @brief セルのピース
     * @throws std::out_of_range グリッド外、または未配置
     */
    const Piece& at(int i, int j) const;
    const Piece& at(const Coord& c) const { return at(c.i, c.j); }

    /**
     * @brief セルが配置済みか
     */
    bool has_piece(int i, int j) const;

    /**
     * @brief セルにピースを置く
     * @throws std::out_of_range グリッド外
     * @throws std::invalid_argument 対角に菱形、または対角外に三角形を置いた場合
     */
    void set(int i, int j, PiecePtr piece);

    const std::string& north_west_labels() const { return north_west_; }
    const std::string& north_east_labels() const { return north_east_; }

    /**
     * @brief 南辺のワード（対角のピースから読む）
     * @throws std::out_of_range 対角が未配置
     */
    std::string south_labels() const;

    /**
     * @brief 全セルが配置済みか
     */
    bool is_complete() const;

    /**
     * @brief 全ての共有辺と外周のラベルが一致しているか
     */
    bool is_consistent() const;

    // ===== キンク（次に埋めるセル）による逐次充填 =====

    /**
     * @brief 次に埋めるセル
     *
     * (1, n), (2, n), ..., (n, n), (1, n-1), ... の順に進む。
     */
    Coord kink() const { return kink_; }

    /**
     * @brief 全セルを埋め終えたか
     */
    bool is_completed() const { return kink_.j == 0; }

    /**
     * @brief キンクの北西辺に来るべきラベル
     */
    EdgeLabel north_west_label_of_kink() const;

    /**
     * @brief キンクの北東辺に来るべきラベル
     */
    EdgeLabel north_east_label_of_kink() const;

    /**
     * @brief キンクにピースを置いてキンクを進める
     */
    void add_piece(PiecePtr piece);

    /**
     * @brief 最後に置いたピースを外してキンクを戻す
     */
    void remove_last_piece();

    bool operator==(const PuzzleFilling& other) const;
    bool operator!=(const PuzzleFilling& other) const { return !(*this == other); }

private:
    size_t index(int i, int j) const;

    int n_;
    std::string north_west_;
    std::string north_east_;
    std::vector<PiecePtr> cells_;  // (i, j) -> index(i, j)
    Coord kink_;
};

} // namespace lr_puzzle

#endif // LR_PUZZLE_PUZZLE_HPP

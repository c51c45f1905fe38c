/**
 * @file piece_catalog.hpp
 * @brief ピースカタログと辺制約
 */
#ifndef LR_PUZZLE_PIECE_CATALOG_HPP
#define LR_PUZZLE_PIECE_CATALOG_HPP

#include "lr_puzzle/piece.hpp"
#include <optional>
#include <vector>

namespace lr_puzzle {

/**
 * @brief 1 セルについて判明している辺ラベル
 *
 * 対角セル（三角形）は north_west, north_east, south を、
 * 菱形セルは north_west, north_east, south_east, south_west を使う。
 * 値が無い辺は未確定で、候補選択では照合しない。
 */
struct EdgeConstraints {
    std::optional<EdgeLabel> north_west;
    std::optional<EdgeLabel> north_east;
    std::optional<EdgeLabel> south_east;
    std::optional<EdgeLabel> south_west;
    std::optional<EdgeLabel> south;

    /**
     * @brief 辺に対応するフィールド
     * @throws std::invalid_argument North（セルの外周に North は無い）
     */
    std::optional<EdgeLabel>& at(Edge edge);
    const std::optional<EdgeLabel>& at(Edge edge) const;

    /**
     * @brief 確定している辺の数
     */
    size_t known_count() const;

    /**
     * @brief 既知の辺が全てピースと一致するか
     */
    bool admits(const Piece& piece) const;
};

/**
 * @brief ピースカタログ（不変値）
 *
 * 各リストは border の辞書順（0 < 1 < 10）で安定整列済みで、
 * 先頭ほど '0' の多い縮退したピースになる。
 */
class PieceCatalog {
public:
    /**
     * @brief 三角形の集合からカタログを作成
     *
     * 菱形は内部辺が一致する (Delta, Nabla) の全ての組。
     * 南辺用の三角形は南ラベルが forbidden_boundary に含まれない Delta。
     *
     * @param deltas 上向き三角形
     * @param nablas 下向き三角形
     * @param forbidden_boundary パズル外周に現れないラベル
     */
    PieceCatalog(std::vector<Piece> deltas, std::vector<Piece> nablas,
                 std::vector<EdgeLabel> forbidden_boundary);

    /**
     * @brief Grassmannian のコホモロジー (H) 用カタログ
     *
     * 0 三角形、1 三角形、(1, 0, 10) 三角形とそれらの回転。
     */
    static PieceCatalog h_grassmannian();

    const std::vector<PiecePtr>& deltas() const { return deltas_; }
    const std::vector<PiecePtr>& nablas() const { return nablas_; }
    const std::vector<PiecePtr>& rhombi() const { return rhombi_; }

    /**
     * @brief 対角（南辺）に置ける三角形
     */
    const std::vector<PiecePtr>& triangles() const { return triangles_; }

    /**
     * @brief セル種別ごとの候補リスト
     */
    const std::vector<PiecePtr>& candidates(bool diagonal) const {
        return diagonal ? triangles_ : rhombi_;
    }

    /**
     * @brief 既知の辺と一致する最初の候補
     * @param known 判明している辺ラベル
     * @param diagonal 対角セルなら true
     * @param checks 照合した候補数の加算先（省略可）
     * @return 見つからなければ nullptr
     */
    PiecePtr first_match(const EdgeConstraints& known, bool diagonal,
                         size_t* checks = nullptr) const;

    /**
     * @brief 外周ラベルが完全に一致するピース
     * @return 見つからなければ nullptr
     */
    PiecePtr find(bool diagonal, const std::vector<EdgeLabel>& border) const;

    /**
     * @brief 外周に現れないラベルか
     */
    bool is_forbidden_on_boundary(EdgeLabel label) const;

private:
    std::vector<PiecePtr> deltas_;
    std::vector<PiecePtr> nablas_;
    std::vector<PiecePtr> rhombi_;
    std::vector<PiecePtr> triangles_;
    std::vector<EdgeLabel> forbidden_boundary_;
};

} // namespace lr_puzzle

#endif // LR_PUZZLE_PIECE_CATALOG_HPP

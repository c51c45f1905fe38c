/**
 * @file piece.hpp
 * @brief パズルピース（三角形・菱形）と辺ラベル
 */
#ifndef LR_PUZZLE_PIECE_HPP
#define LR_PUZZLE_PIECE_HPP

#include <array>
#include <vector>
#include <string>
#include <memory>
#include <cstdint>

namespace lr_puzzle {

/**
 * @brief 辺ラベル
 *
 * 列挙順 (0 < 1 < 10) がカタログの整列順になる。
 */
enum class EdgeLabel : uint8_t {
    Zero,     // "0"
    One,      // "1"
    OneZero   // "10"
};

/**
 * @brief 辺の向き
 */
enum class Edge : uint8_t {
    NorthWest,
    NorthEast,
    SouthEast,
    SouthWest,
    North,
    South
};

/**
 * @brief ピースの形
 */
enum class PieceKind : uint8_t {
    Delta,    // 上向き三角形 (north_west, north_east, south)
    Nabla,    // 下向き三角形 (north, south_east, south_west)
    Rhombus   // Delta の下に Nabla を貼った菱形
};

/**
 * @brief ラベルを文字列に変換 ("0", "1", "10")
 */
const char* to_string(EdgeLabel label);

/**
 * @brief 辺名を文字列に変換 ("north_west" など)
 */
const char* to_string(Edge edge);

/**
 * @brief 文字列をラベルに変換
 * @throws FormatError "0", "1", "10" 以外
 */
EdgeLabel parse_edge_label(const std::string& text);

/**
 * @brief 境界ラベル ('0'/'1' の 1 文字) をラベルに変換
 * @throws FormatError '0'/'1' 以外
 */
EdgeLabel edge_label_from_char(char c);

/**
 * @brief 境界用の 1 文字に変換
 * @throws FormatError "10" は境界に現れないため変換できない
 */
char edge_label_to_char(EdgeLabel label);

/**
 * @brief パズルピース（不変値）
 *
 * Rhombus は north piece（Delta）と south piece（Nabla）を
 * 水平な内部辺で貼り合わせたもの。外周は 4 辺で、内部辺は border に含めない。
 */
class Piece {
public:
    /**
     * @brief 上向き三角形を作成
     */
    static Piece delta(EdgeLabel north_west, EdgeLabel north_east, EdgeLabel south);

    /**
     * @brief 下向き三角形を作成
     */
    static Piece nabla(EdgeLabel north, EdgeLabel south_east, EdgeLabel south_west);

    /**
     * @brief 菱形を作成
     * @param north_piece 上半分（Delta）
     * @param south_piece 下半分（Nabla）
     * @throws std::invalid_argument 形が違う、または内部辺のラベルが一致しない場合
     */
    static Piece rhombus(const Piece& north_piece, const Piece& south_piece);

    PieceKind kind() const { return kind_; }

    bool is_delta() const { return kind_ == PieceKind::Delta; }
    bool is_nabla() const { return kind_ == PieceKind::Nabla; }
    bool is_rhombus() const { return kind_ == PieceKind::Rhombus; }

    /**
     * @brief 外周の辺（border の並び順）
     */
    const std::vector<Edge>& edges() const;

    /**
     * @brief 辺が外周に含まれるか
     */
    bool has_edge(Edge edge) const;

    /**
     * @brief 辺のラベル
     * @throws std::out_of_range 外周にない辺
     */
    EdgeLabel label(Edge edge) const;

    /**
     * @brief 外周ラベルを edges() の順に並べたもの
     */
    std::vector<EdgeLabel> border() const;

    /**
     * @brief 全ての辺が 1 か
     */
    bool is_all_ones() const;

    /**
     * @brief 菱形の上半分
     * @pre is_rhombus()
     */
    Piece north_piece() const;

    /**
     * @brief 菱形の下半分
     * @pre is_rhombus()
     */
    Piece south_piece() const;

    /**
     * @brief 菱形の内部（水平）辺のラベル
     * @pre is_rhombus()
     */
    EdgeLabel middle_label() const { return labels_[4]; }

    /**
     * @brief ラベル中の '0' の個数
     */
    size_t zero_count() const;

    /**
     * @brief "delta(1, 0, 10)" 形式の文字列
     */
    std::string to_string() const;

    bool operator==(const Piece& other) const {
        return kind_ == other.kind_ && labels_ == other.labels_;
    }
    bool operator!=(const Piece& other) const { return !(*this == other); }

private:
    Piece(PieceKind kind, std::array<EdgeLabel, 5> labels)
        : kind_(kind), labels_(labels) {}

    size_t slot(Edge edge) const;

    PieceKind kind_;
    // Delta: nw, ne, s / Nabla: n, se, sw / Rhombus: nw, ne, se, sw, 内部辺
    std::array<EdgeLabel, 5> labels_;
};

using PiecePtr = std::shared_ptr<const Piece>;

} // namespace lr_puzzle

#endif // LR_PUZZLE_PIECE_HPP

/**
 * @file document.hpp
 * @brief .lrp テキスト形式の中間表現
 */
#ifndef LR_PUZZLE_TEXT_DOCUMENT_HPP
#define LR_PUZZLE_TEXT_DOCUMENT_HPP

#include "lr_puzzle/piece_catalog.hpp"
#include "lr_puzzle/puzzle.hpp"
#include "lr_puzzle/tableau.hpp"
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace lr_puzzle {
namespace text {

/**
 * @brief abacus "010101";
 */
struct AbacusDecl {
    std::string word;
    int line = 0;
};

/**
 * @brief partition [3, 2, 1] size 10;
 */
struct PartitionDecl {
    std::vector<int> parts;
    std::optional<int> size;
    int line = 0;
};

/**
 * @brief tableau [[_, _, 1], [_, 2], [1]] size 7;
 */
struct TableauDecl {
    std::vector<Row> rows;
    std::optional<int> size;
    int line = 0;

    /**
     * @brief SkewTableau に変換
     * @throws std::runtime_error 歪半標準タブローでない場合（行番号付き）
     */
    SkewTableau to_tableau() const;
};

/**
 * @brief パズル内の 1 セル: (i, j) ラベル...;
 *
 * 三角形は north_west north_east south の 3 つ、
 * 菱形は north_west north_east south_east south_west の 4 つ。
 */
struct CellDecl {
    int i = 0;
    int j = 0;
    std::vector<EdgeLabel> labels;
    int line = 0;
};

/**
 * @brief puzzle "nw" "ne" { セル... }
 */
struct PuzzleDecl {
    std::string north_west;
    std::string north_east;
    std::vector<CellDecl> cells;
    int line = 0;

    /**
     * @brief PuzzleFilling に変換
     *
     * 各セルの外周ラベルをカタログで引いてピースを決める。
     *
     * @throws std::runtime_error 該当ピースが無い、セルの重複・欠落、
     *         隣接する辺の不一致（行番号付き）
     */
    PuzzleFilling to_puzzle(const PieceCatalog& catalog) const;
};

using Statement = std::variant<AbacusDecl, PartitionDecl, TableauDecl, PuzzleDecl>;

/**
 * @brief .lrp ドキュメント（文の並び）
 */
class Document {
public:
    Document() = default;

    /**
     * @brief 文を追加
     */
    void add_statement(Statement statement) { statements_.push_back(std::move(statement)); }

    const std::vector<Statement>& statements() const { return statements_; }

    size_t size() const { return statements_.size(); }

private:
    std::vector<Statement> statements_;
};

/**
 * @brief パズルを puzzle 文として書き出す
 */
void write_puzzle(std::ostream& out, const PuzzleFilling& puzzle);

/**
 * @brief .lrp ファイルをパース
 * @param filename ファイル名
 * @return パースされたドキュメント
 * @throws std::runtime_error パースエラー時
 */
std::unique_ptr<Document> parse_file(const std::string& filename);

/**
 * @brief .lrp 文字列をパース
 * @param input 入力文字列
 * @return パースされたドキュメント
 * @throws std::runtime_error パースエラー時
 */
std::unique_ptr<Document> parse_string(const std::string& input);

} // namespace text
} // namespace lr_puzzle

#endif // LR_PUZZLE_TEXT_DOCUMENT_HPP

/**
 * @file tableau.hpp
 * @brief 歪半標準タブロー
 */
#ifndef LR_PUZZLE_TABLEAU_HPP
#define LR_PUZZLE_TABLEAU_HPP

#include "lr_puzzle/partition.hpp"
#include <optional>
#include <vector>
#include <string>

namespace lr_puzzle {

/**
 * @brief タブローのマス（std::nullopt は内側形状の空きマス）
 */
using Cell = std::optional<int>;

/**
 * @brief タブローの 1 行（左から右）
 */
using Row = std::vector<Cell>;

/**
 * @brief 歪半標準タブロー
 *
 * 各行は空きマスの並びの後に正の整数が続く。
 * 行内は左から右へ広義単調増加、列は上から下へ狭義単調増加。
 * 内側形状・外側形状はともに分割でなければならない。
 */
class SkewTableau {
public:
    /**
     * @brief 空のタブローを作成
     */
    SkewTableau() = default;

    /**
     * @brief 行の列からタブローを作成
     *
     * 検査するのは歪形状と半標準性だけで、LR 条件は検査しない
     * （is_littlewood_richardson() で確認する）。
     *
     * @param rows 上から下への行
     * @throws std::invalid_argument 歪形状・半標準性を満たさない場合
     */
    explicit SkewTableau(std::vector<Row> rows);

    /**
     * @brief 行数 L
     */
    size_t row_count() const { return rows_.size(); }

    bool empty() const { return rows_.empty(); }

    const std::vector<Row>& rows() const { return rows_; }
    const Row& operator[](size_t r) const { return rows_[r]; }

    /**
     * @brief 外側形状（各行のマス数）
     */
    Partition outer_shape() const;

    /**
     * @brief 内側形状（各行の空きマス数）
     */
    Partition inner_shape() const;

    /**
     * @brief 重み（weight[v-1] は値 v の個数）
     */
    std::vector<int> weight() const;

    /**
     * @brief 行 r に含まれる値 value の個数
     */
    int count(size_t r, int value) const;

    /**
     * @brief 読み語（上の行から、各行は右から左）
     */
    std::vector<int> reading_word() const;

    /**
     * @brief Littlewood-Richardson タブローか（読み語が格子語で重みが分割）
     */
    bool is_littlewood_richardson() const;

    /**
     * @brief "[[_, _, 1], [_, 2], [1]]" 形式の文字列
     */
    std::string to_string() const;

    bool operator==(const SkewTableau& other) const { return rows_ == other.rows_; }
    bool operator!=(const SkewTableau& other) const { return rows_ != other.rows_; }
    bool operator<(const SkewTableau& other) const { return rows_ < other.rows_; }

private:
    void validate() const;

    std::vector<Row> rows_;
};

} // namespace lr_puzzle

#endif // LR_PUZZLE_TABLEAU_HPP

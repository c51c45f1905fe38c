/**
 * @file bijection.hpp
 * @brief パズル充填と LR タブローの全単射
 */
#ifndef LR_PUZZLE_BIJECTION_HPP
#define LR_PUZZLE_BIJECTION_HPP

#include "lr_puzzle/piece_catalog.hpp"
#include "lr_puzzle/puzzle.hpp"
#include "lr_puzzle/tableau.hpp"
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lr_puzzle {

/**
 * @brief 逆写像で使う青い三角形の位置
 *
 * delta は 1 三角形（上向き）、nabla は 1 三角形（下向き）のセル。
 * 北東辺から入る経路の起点に当たる仮想的な nabla（j = n + 1）は含めない。
 */
struct BluePositions {
    std::set<Coord> delta;
    std::set<Coord> nabla;
};

/**
 * @brief 変換の統計情報
 */
struct BijectionStats {
    size_t traced_rows = 0;
    size_t trace_steps = 0;
    size_t delta_blue_count = 0;
    size_t nabla_blue_count = 0;
    size_t constrained_edges = 0;
    size_t filled_cells = 0;
    size_t candidate_checks = 0;
};

/**
 * @brief パズル → タブロー、タブロー → パズルの変換器
 *
 * カタログは構築時に受け取り、共有するが変更しない。
 * 統計情報を持つため、スレッドごとに別のインスタンスを使うこと。
 */
class Bijection {
public:
    explicit Bijection(std::shared_ptr<const PieceCatalog> catalog);

    /**
     * @brief 北東辺の '1' から経路を辿り、タブローの 1 行分の中身を得る
     *
     * 西向きに進む間は上向き三角形を見る。1 三角形なら南へ曲がり、
     * それまでに集めた値を全て 1 増やす。(10, 1, 0) 三角形なら
     * 1 セル西へ進み、値を先頭に積む。南向きに進む間は下向き三角形を見て、
     * 1 三角形なら西へ曲がる。対角に達したら終了。
     *
     * @param puzzle 充填済みのパズル
     * @param coord 北東辺上の位置（1 始まり）
     * @return 行の中身（左から右、正の整数）
     * @throws PreconditionError coord の北東ラベルが '1' でない場合
     * @throws ConsistencyError 経路がグリッドから外れた、または想定外のピース
     */
    std::vector<int> trace_row(const PuzzleFilling& puzzle, int coord);

    /**
     * @brief パズルをタブローに変換
     *
     * 北東辺の '1' ごとに 1 行を作り、南辺ワードの分割の分だけ空きマスを
     * 前置する。上の '1' ほど下の行になる。マスの無い行は除く。
     */
    SkewTableau puzzle_to_tableau(const PuzzleFilling& puzzle);

    /**
     * @brief タブローをパズルに変換
     * @param tableau LR タブロー
     * @param size パズルサイズ（省略時は minimum_size()）
     * @throws SizeError size が minimum_size() 未満
     * @throws PreconditionError 重みが分割でない
     * @throws NoCandidateError 既知の辺を満たすピースが無い（不正なタブロー）
     */
    PuzzleFilling tableau_to_puzzle(const SkewTableau& tableau,
                                    std::optional<int> size = std::nullopt);

    /**
     * @brief 青い三角形の位置を計算
     * @param tableau LR タブロー
     * @param lam 北西辺のワード
     * @param nu 南辺のワード
     */
    BluePositions blue_positions(const SkewTableau& tableau,
                                 const std::string& lam,
                                 const std::string& nu) const;

    /**
     * @brief タブローを収めるのに必要な最小サイズ
     *
     * max(weight[0] + L, outer[0] + L)
     */
    static int minimum_size(const SkewTableau& tableau);

    /**
     * @brief 統計情報を取得
     */
    const BijectionStats& stats() const { return stats_; }

    /**
     * @brief 統計情報をリセット
     */
    void reset_stats() { stats_ = BijectionStats{}; }

    /**
     * @brief 詳細ログ（stderr）を有効/無効にする
     */
    void set_verbose(bool verbose) { verbose_ = verbose; }

    /**
     * @brief 逆写像で使うピースカタログ
     * @throws std::invalid_argument カタログ無しで構築した場合
     */
    const PieceCatalog& catalog() const;

private:
    std::shared_ptr<const PieceCatalog> catalog_;
    BijectionStats stats_;
    bool verbose_ = false;
};

/**
 * @brief パズルをタブローに変換（一時的な変換器を使う）
 */
SkewTableau puzzle_to_tableau(const PuzzleFilling& puzzle);

/**
 * @brief タブローをパズルに変換（一時的な変換器を使う）
 */
PuzzleFilling tableau_to_puzzle(const SkewTableau& tableau,
                                std::shared_ptr<const PieceCatalog> catalog,
                                std::optional<int> size = std::nullopt);

} // namespace lr_puzzle

#endif // LR_PUZZLE_BIJECTION_HPP

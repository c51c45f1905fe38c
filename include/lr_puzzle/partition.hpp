/**
 * @file partition.hpp
 * @brief 整数分割（ヤング図形の行の長さ）
 */
#ifndef LR_PUZZLE_PARTITION_HPP
#define LR_PUZZLE_PARTITION_HPP

#include <vector>
#include <string>
#include <cstddef>

namespace lr_puzzle {

/**
 * @brief 広義単調減少な非負整数列
 *
 * 末尾の 0 は保持しない。範囲外の添字は 0 として読む
 * （0 を補っても表す分割は変わらない）。
 */
class Partition {
public:
    using value_type = int;

    /**
     * @brief 空の分割を作成
     */
    Partition() = default;

    /**
     * @brief 整数列から分割を作成
     * @param parts 広義単調減少な非負整数列（末尾の 0 は除去される）
     * @throws FormatError 負の値または増加箇所がある場合
     */
    explicit Partition(std::vector<value_type> parts);

    /**
     * @brief 0 でない部分の個数
     */
    size_t length() const { return parts_.size(); }

    /**
     * @brief 空の分割か
     */
    bool empty() const { return parts_.empty(); }

    /**
     * @brief i 番目の部分（範囲外なら 0）
     */
    value_type operator[](size_t i) const { return i < parts_.size() ? parts_[i] : 0; }

    /**
     * @brief 部分の総和（箱の数）
     */
    value_type size() const;

    /**
     * @brief 0 でない部分の列
     */
    const std::vector<value_type>& parts() const { return parts_; }

    /**
     * @brief 長さ length まで 0 で補った列を取得
     *
     * length が length() より小さい場合は切り詰めずにそのまま返す。
     */
    std::vector<value_type> padded(size_t length) const;

    /**
     * @brief "[3, 2, 1]" 形式の文字列
     */
    std::string to_string() const;

    bool operator==(const Partition& other) const { return parts_ == other.parts_; }
    bool operator!=(const Partition& other) const { return parts_ != other.parts_; }

private:
    std::vector<value_type> parts_;
};

} // namespace lr_puzzle

#endif // LR_PUZZLE_PARTITION_HPP

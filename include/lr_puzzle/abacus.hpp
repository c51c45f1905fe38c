/**
 * @file abacus.hpp
 * @brief アバカス（0/1 列）と分割の相互変換
 */
#ifndef LR_PUZZLE_ABACUS_HPP
#define LR_PUZZLE_ABACUS_HPP

#include "lr_puzzle/partition.hpp"
#include <string>
#include <vector>

namespace lr_puzzle {

/**
 * @brief アバカスを分割に変換
 *
 * 左から走査し、各 '1' についてそれより左にある '0' の個数を
 * 分割の部分として先頭に積む。"010101" は [3, 2, 1] になる。
 *
 * @param abacus '0' と '1' からなる文字列
 * @throws FormatError '0'/'1' 以外の文字を含む場合
 */
Partition abacus_to_partition(const std::string& abacus);

/**
 * @brief 整数列で与えたアバカスを分割に変換
 * @throws FormatError 0/1 以外の値を含む場合
 */
Partition abacus_to_partition(const std::vector<int>& abacus);

/**
 * @brief 分割をアバカスに変換
 *
 * 部分の個数だけ '1' を置き、小さい部分から順に差分だけ '0' を
 * 直前に挿入する。0 の部分も '1' を 1 つ生む（長さ L に補った重みなど）。
 * 結果の長さが min_size 未満なら右を '0' で埋める。
 *
 * @param parts 広義単調減少な非負整数列
 * @param min_size 出力の最小長
 * @throws FormatError parts が分割でない場合
 */
std::string partition_to_abacus(const std::vector<int>& parts, size_t min_size = 0);

/**
 * @brief 分割をアバカスに変換（末尾の 0 を持たない版）
 */
std::string partition_to_abacus(const Partition& partition, size_t min_size = 0);

} // namespace lr_puzzle

#endif // LR_PUZZLE_ABACUS_HPP

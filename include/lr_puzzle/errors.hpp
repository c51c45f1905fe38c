/**
 * @file errors.hpp
 * @brief 変換処理で送出する例外クラス
 */
#ifndef LR_PUZZLE_ERRORS_HPP
#define LR_PUZZLE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace lr_puzzle {

/**
 * @brief 入力の書式エラー（アバカスに 0/1 以外の記号など）
 */
class FormatError : public std::invalid_argument {
public:
    explicit FormatError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief 事前条件違反（境界ラベルが '1' でない位置からの追跡など）
 */
class PreconditionError : public std::invalid_argument {
public:
    explicit PreconditionError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief 指定されたパズルサイズが必要最小サイズを下回る
 */
class SizeError : public PreconditionError {
public:
    explicit SizeError(const std::string& what) : PreconditionError(what) {}
};

/**
 * @brief 既知の辺ラベルを満たすピースがカタログに存在しない
 *
 * 不正なタブロー、またはカタログとアルゴリズムの不一致を意味する。
 */
class NoCandidateError : public std::runtime_error {
public:
    explicit NoCandidateError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief 内部整合性エラー（追跡経路がグリッド外に出た等、パズルが不正）
 */
class ConsistencyError : public std::logic_error {
public:
    explicit ConsistencyError(const std::string& what) : std::logic_error(what) {}
};

} // namespace lr_puzzle

#endif // LR_PUZZLE_ERRORS_HPP

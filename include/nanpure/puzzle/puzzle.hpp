/**
 * @file puzzle.hpp
 * @brief パズルテキストの読み込み
 */
#ifndef NANPURE_PUZZLE_PUZZLE_HPP
#define NANPURE_PUZZLE_PUZZLE_HPP

#include "nanpure/grid.hpp"
#include <string>
#include <vector>

namespace nanpure {
namespace puzzle {

/**
 * @brief パズルテキストの解析結果
 *
 * 空行以外の各行から数字の並びを取り出したもの。
 * 行の値の数や行数が9でない場合も rows はそのまま返し、
 * 問題点を errors に記録する（例外は投げない）。
 */
struct PuzzleText {
    RawGrid rows;
    std::vector<std::string> errors;

    bool ok() const { return errors.empty(); }
};

/**
 * @brief パズルテキストを解析
 *
 * 書式:
 * - 空白のみの行は無視し、行番号にも数えない
 * - 連続する10進数字を1つの値とし、それ以外の文字は区切りとみなす
 * - 数字を含まない行（"------+------" など）は読み飛ばすが行番号には数える
 */
PuzzleText parse_string(const std::string& input);

/**
 * @brief パズルファイルを解析
 * @throws std::runtime_error ファイルを開けない場合
 */
PuzzleText parse_file(const std::string& filename);

} // namespace puzzle
} // namespace nanpure

#endif // NANPURE_PUZZLE_PUZZLE_HPP

/**
 * @file catalog.hpp
 * @brief パズルディレクトリの一覧
 */
#ifndef NANPURE_PUZZLE_CATALOG_HPP
#define NANPURE_PUZZLE_CATALOG_HPP

#include <string>
#include <vector>

namespace nanpure {
namespace puzzle {

/**
 * @brief カタログのエントリ
 */
struct PuzzleEntry {
    std::string name;  // 拡張子を除いたファイル名
    std::string file;  // ファイル名
};

/**
 * @brief ディレクトリ内の .txt パズルを表示順に列挙
 *
 * 整数で始まる名前をその整数の順に先に並べ、残りを名前の辞書順で続ける。
 * 整数が等しい場合も名前の辞書順で比較する。
 *
 * @throws std::runtime_error ディレクトリが存在しない場合
 */
std::vector<PuzzleEntry> list_puzzles(const std::string& dir);

/**
 * @brief エントリのファイルパスを取得
 */
std::string puzzle_path(const std::string& dir, const PuzzleEntry& entry);

/**
 * @brief 名前の表示順を比較（a が b より前なら true）
 */
bool entry_name_less(const std::string& a, const std::string& b);

} // namespace puzzle
} // namespace nanpure

#endif // NANPURE_PUZZLE_CATALOG_HPP

/**
 * @file constraint.hpp
 * @brief 行・列・ブロックの一意性制約
 */
#ifndef NANPURE_CONSTRAINT_HPP
#define NANPURE_CONSTRAINT_HPP

#include "nanpure/grid.hpp"

namespace nanpure {

/**
 * @brief セルが属する 3×3 ブロックの番号（0〜8、行優先）
 */
inline size_t box_index(size_t row, size_t col) {
    return (row / Grid::BOX) * Grid::BOX + col / Grid::BOX;
}

/**
 * @brief 指定マスに数字を置けるか判定
 *
 * 同じ行・列・ブロックのどのセルも digit を保持していなければ true。
 * ブロックと行・列の重なり4マスは二重に調べるが結果は変わらない。
 * 盤面は変更しない。
 */
bool can_place(const Grid& grid, size_t row, size_t col, Grid::value_type digit);

/**
 * @brief 解が正しいか検証
 *
 * 空きマスがなく、全ての行・列・ブロックが 1〜9 の順列であり、
 * puzzle の非0セルがそのまま残っていれば true。
 */
bool is_valid_solution(const Grid& solution, const Grid& puzzle);

} // namespace nanpure

#endif // NANPURE_CONSTRAINT_HPP

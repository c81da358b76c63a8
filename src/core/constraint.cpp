#include "nanpure/constraint.hpp"
#include <cstdint>

namespace nanpure {

bool can_place(const Grid& grid, size_t row, size_t col, Grid::value_type digit) {
    // 行・列
    for (size_t i = 0; i < Grid::N; ++i) {
        if (grid.at(row, i) == digit || grid.at(i, col) == digit) {
            return false;
        }
    }

    // ブロック
    size_t top = (row / Grid::BOX) * Grid::BOX;
    size_t left = (col / Grid::BOX) * Grid::BOX;
    for (size_t r = top; r < top + Grid::BOX; ++r) {
        for (size_t c = left; c < left + Grid::BOX; ++c) {
            if (grid.at(r, c) == digit) {
                return false;
            }
        }
    }
    return true;
}

bool is_valid_solution(const Grid& solution, const Grid& puzzle) {
    // 各行・列・ブロックで使用済みの数字をビットで管理
    uint16_t row_mask[Grid::N] = {};
    uint16_t col_mask[Grid::N] = {};
    uint16_t box_mask[Grid::N] = {};

    for (size_t r = 0; r < Grid::N; ++r) {
        for (size_t c = 0; c < Grid::N; ++c) {
            auto v = solution.at(r, c);
            if (v < 1 || v > static_cast<Grid::value_type>(Grid::N)) {
                return false;
            }
            auto given = puzzle.at(r, c);
            if (given != Grid::EMPTY && given != v) {
                return false;
            }

            uint16_t bit = static_cast<uint16_t>(1u << (v - 1));
            size_t b = box_index(r, c);
            if ((row_mask[r] & bit) || (col_mask[c] & bit) || (box_mask[b] & bit)) {
                return false;
            }
            row_mask[r] |= bit;
            col_mask[c] |= bit;
            box_mask[b] |= bit;
        }
    }
    return true;
}

} // namespace nanpure

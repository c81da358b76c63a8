/**
 * @file grid.hpp
 * @brief 9×9 盤面クラス
 */
#ifndef NANPURE_GRID_HPP
#define NANPURE_GRID_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace nanpure {

/**
 * @brief 未検証の入力盤面（行のリスト）
 *
 * 形状・値域は任意。Validator を通してから Grid に変換する。
 */
using RawGrid = std::vector<std::vector<std::int64_t>>;

/**
 * @brief 9×9 の数独盤面
 *
 * 0 は空きマス、1〜9 は確定した数字を表す。
 * セルは行優先のフラット配列で保持する。
 */
class Grid {
public:
    using value_type = int;

    static constexpr size_t N = 9;
    static constexpr size_t BOX = 3;
    static constexpr size_t CELL_COUNT = N * N;
    static constexpr value_type EMPTY = 0;

    /**
     * @brief 全マス空の盤面を作成
     */
    Grid();

    /**
     * @brief 行リストから盤面を作成
     * @param rows 9行×9列、値が [0, 9] の盤面
     * @throws std::out_of_range 形状または値域が不正な場合
     * @note 形状・値域は事前に Validator で確認しておくこと
     */
    static Grid from_rows(const RawGrid& rows);

    /**
     * @brief セルの値を取得
     */
    value_type at(size_t row, size_t col) const { return cells_[row * N + col]; }

    /**
     * @brief セルの値を設定
     */
    void set(size_t row, size_t col, value_type value) { cells_[row * N + col] = value; }

    /**
     * @brief 空きマスかどうか
     */
    bool is_empty(size_t row, size_t col) const { return at(row, col) == EMPTY; }

    /**
     * @brief 空きマスの数
     */
    size_t count_empty() const;

    /**
     * @brief 空きマスが残っていないか
     */
    bool is_complete() const { return count_empty() == 0; }

    /**
     * @brief 行リスト形式に変換
     */
    RawGrid to_rows() const;

    bool operator==(const Grid& other) const { return cells_ == other.cells_; }
    bool operator!=(const Grid& other) const { return cells_ != other.cells_; }

private:
    std::array<value_type, CELL_COUNT> cells_;
};

} // namespace nanpure

#endif // NANPURE_GRID_HPP

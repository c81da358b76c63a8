/**
 * @file solver.hpp
 * @brief 数独ソルバークラス（深さ優先バックトラック）
 */
#ifndef NANPURE_SOLVER_HPP
#define NANPURE_SOLVER_HPP

#include "nanpure/grid.hpp"
#include "nanpure/error.hpp"
#include "nanpure/validator.hpp"

namespace nanpure {

/**
 * @brief ソルバー統計情報（直前の solve() 1回分）
 */
struct SolverStats {
    size_t empty_cells = 0;      // 探索開始時の空きマス数
    size_t node_count = 0;       // 確定させた配置の数
    size_t backtrack_count = 0;  // 取り消した配置の数
    size_t max_depth = 0;        // 最大再帰深さ
};

/**
 * @brief 数独ソルバー
 *
 * 入力を Validator で検証した後、空きマスを行優先で走査し、
 * 候補 1〜9 を昇順に試す深さ優先探索で最初に見つかった解を返す。
 * 解の一意性は確認しない。
 *
 * 入力盤面は変更せず、solve() ごとに作業用コピーを持つ。
 * 呼び出し間で引き継ぐ状態は統計情報のみ（solve() の先頭でリセット）。
 */
class Solver {
public:
    Solver() = default;

    /**
     * @brief 未検証の盤面を解く
     * @param rows 入力盤面（変更しない）
     * @return 完成した盤面、または Shape / Range / Conflict / Unsolvable のエラー
     */
    SolveOutcome solve(const RawGrid& rows);

    /**
     * @brief 9×9 の Grid を解く
     */
    SolveOutcome solve(const Grid& puzzle);

    /**
     * @brief 統計情報を取得
     */
    const SolverStats& stats() const { return stats_; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

private:
    /**
     * @brief バックトラック探索
     * @param puzzle 元の盤面（全マス埋まった時点の検証用）
     * @param grid 作業盤面（探索中に書き換える）
     * @param pos 走査を再開するセル位置（行優先のフラットインデックス）
     * @param depth 再帰深さ
     * @return 全マスを埋められたら true（grid に解が残る）
     */
    bool search(const Grid& puzzle, Grid& grid, size_t pos, size_t depth);

    Validator validator_;
    SolverStats stats_;
    bool verbose_ = false;
};

} // namespace nanpure

#endif // NANPURE_SOLVER_HPP

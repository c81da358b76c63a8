#include "nanpure/solver.hpp"
#include "nanpure/constraint.hpp"
#include <iostream>
#include <utility>

namespace nanpure {

SolveOutcome Solver::solve(const RawGrid& rows) {
    stats_ = SolverStats{};

    if (verbose_) {
        std::cerr << "[verbose] validate start: " << rows.size() << " rows\n";
    }
    Grid working;
    if (auto err = validator_.validate(rows, working)) {
        if (verbose_) std::cerr << "[verbose] validate failed: " << err->message << "\n";
        return SolveOutcome::failure(std::move(*err));
    }
    if (verbose_) std::cerr << "[verbose] validate done\n";

    const Grid puzzle = working;
    stats_.empty_cells = working.count_empty();
    if (verbose_) {
        std::cerr << "[verbose] search start: " << stats_.empty_cells << " empty cells\n";
    }

    bool found = search(puzzle, working, 0, 0);

    if (verbose_) {
        std::cerr << "[verbose] search " << (found ? "solved" : "exhausted")
                  << ": nodes=" << stats_.node_count
                  << " backtracks=" << stats_.backtrack_count
                  << " max_depth=" << stats_.max_depth << "\n";
    }

    if (!found) {
        return SolveOutcome::failure(
            SolveError{ErrorKind::Unsolvable, "puzzle has no solution", std::nullopt, std::nullopt});
    }
    return SolveOutcome::success(std::move(working));
}

SolveOutcome Solver::solve(const Grid& puzzle) {
    // set() で範囲外の値が入り得るので行リスト経由で全検査を通す
    return solve(puzzle.to_rows());
}

bool Solver::search(const Grid& puzzle, Grid& grid, size_t pos, size_t depth) {
    if (depth > stats_.max_depth) {
        stats_.max_depth = depth;
    }

    // 次の空きマスまで進める
    while (pos < Grid::CELL_COUNT && !grid.is_empty(pos / Grid::N, pos % Grid::N)) {
        ++pos;
    }
    if (pos == Grid::CELL_COUNT) {
        return is_valid_solution(grid, puzzle);
    }

    size_t row = pos / Grid::N;
    size_t col = pos % Grid::N;

    for (Grid::value_type digit = 1; digit <= static_cast<Grid::value_type>(Grid::N); ++digit) {
        if (!can_place(grid, row, col, digit)) {
            continue;
        }

        grid.set(row, col, digit);
        ++stats_.node_count;

        if (search(puzzle, grid, pos + 1, depth + 1)) {
            return true;
        }

        // バックトラック: 兄弟の候補を調べる前に必ず空きマスへ戻す
        grid.set(row, col, Grid::EMPTY);
        ++stats_.backtrack_count;
    }

    return false;
}

} // namespace nanpure

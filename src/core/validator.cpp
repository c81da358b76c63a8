#include "nanpure/validator.hpp"
#include "nanpure/constraint.hpp"
#include <string>
#include <utility>

namespace nanpure {

namespace {

SolveError make_error(ErrorKind kind, std::string message,
                      std::optional<size_t> row = std::nullopt,
                      std::optional<size_t> col = std::nullopt) {
    return SolveError{kind, std::move(message), row, col};
}

}  // namespace

std::optional<SolveError> Validator::validate(const RawGrid& rows) const {
    Grid working;
    return validate(rows, working);
}

std::optional<SolveError> Validator::validate(const RawGrid& rows, Grid& working) const {
    if (auto err = check_shape(rows)) {
        return err;
    }
    if (auto err = check_range(rows)) {
        return err;
    }

    // 作業用コピーで矛盾検査（呼び出し元の盤面には触れない）
    working = Grid::from_rows(rows);
    return check_conflicts(working);
}

std::optional<SolveError> Validator::check_shape(const RawGrid& rows) const {
    if (rows.size() != Grid::N) {
        return make_error(ErrorKind::Shape,
                          "wrong row count: puzzle has " + std::to_string(rows.size())
                              + " rows, expected 9");
    }

    for (size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() != Grid::N) {
            return make_error(ErrorKind::Shape,
                              "wrong column count: row " + std::to_string(r + 1) + " has "
                                  + std::to_string(rows[r].size()) + " values, expected 9",
                              r);
        }
    }
    return std::nullopt;
}

std::optional<SolveError> Validator::check_range(const RawGrid& rows) const {
    for (size_t r = 0; r < rows.size(); ++r) {
        for (size_t c = 0; c < rows[r].size(); ++c) {
            auto v = rows[r][c];
            if (v < 0 || v > static_cast<std::int64_t>(Grid::N)) {
                return make_error(ErrorKind::Range,
                                  "value out of range: row " + std::to_string(r + 1)
                                      + ", column " + std::to_string(c + 1) + " holds "
                                      + std::to_string(v) + ", expected 0-9",
                                  r, c);
            }
        }
    }
    return std::nullopt;
}

std::optional<SolveError> Validator::check_conflicts(Grid& grid) const {
    for (size_t r = 0; r < Grid::N; ++r) {
        for (size_t c = 0; c < Grid::N; ++c) {
            auto value = grid.at(r, c);
            if (value == Grid::EMPTY) {
                continue;
            }

            grid.set(r, c, Grid::EMPTY);
            bool placeable = can_place(grid, r, c, value);
            grid.set(r, c, value);

            if (!placeable) {
                return make_error(ErrorKind::Conflict,
                                  "puzzle has conflicting values: " + std::to_string(value)
                                      + " at row " + std::to_string(r + 1) + ", column "
                                      + std::to_string(c + 1) + " repeats in its row, column or box",
                                  r, c);
            }
        }
    }
    return std::nullopt;
}

} // namespace nanpure

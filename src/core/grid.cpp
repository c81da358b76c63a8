#include "nanpure/grid.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace nanpure {

Grid::Grid() {
    cells_.fill(EMPTY);
}

Grid Grid::from_rows(const RawGrid& rows) {
    if (rows.size() != N) {
        throw std::out_of_range("Grid requires 9 rows, got " + std::to_string(rows.size()));
    }

    Grid grid;
    for (size_t r = 0; r < N; ++r) {
        if (rows[r].size() != N) {
            throw std::out_of_range("Grid row " + std::to_string(r + 1) + " requires 9 values, got "
                                    + std::to_string(rows[r].size()));
        }
        for (size_t c = 0; c < N; ++c) {
            auto v = rows[r][c];
            if (v < 0 || v > static_cast<std::int64_t>(N)) {
                throw std::out_of_range("Grid value out of range: " + std::to_string(v));
            }
            grid.set(r, c, static_cast<value_type>(v));
        }
    }
    return grid;
}

size_t Grid::count_empty() const {
    return static_cast<size_t>(std::count(cells_.begin(), cells_.end(), EMPTY));
}

RawGrid Grid::to_rows() const {
    RawGrid rows(N, std::vector<std::int64_t>(N));
    for (size_t r = 0; r < N; ++r) {
        for (size_t c = 0; c < N; ++c) {
            rows[r][c] = at(r, c);
        }
    }
    return rows;
}

} // namespace nanpure

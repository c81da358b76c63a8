#include <catch2/catch_test_macros.hpp>
#include "nanpure/validator.hpp"
#include <string>

using namespace nanpure;

namespace {

RawGrid empty_rows() {
    return RawGrid(9, std::vector<std::int64_t>(9, 0));
}

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

}  // namespace

// ============================================================================
// Shape
// ============================================================================

TEST_CASE("Validator shape", "[validator][shape]") {
    Validator v;

    SECTION("8 rows") {
        auto rows = empty_rows();
        rows.pop_back();
        auto err = v.validate(rows);
        REQUIRE(err.has_value());
        REQUIRE(err->kind == ErrorKind::Shape);
        REQUIRE(contains(err->message, "wrong row count"));
        REQUIRE(!err->row.has_value());
    }

    SECTION("10 rows") {
        auto rows = empty_rows();
        rows.push_back(std::vector<std::int64_t>(9, 0));
        auto err = v.validate(rows);
        REQUIRE(err.has_value());
        REQUIRE(err->kind == ErrorKind::Shape);
    }

    SECTION("no rows") {
        auto err = v.validate(RawGrid{});
        REQUIRE(err.has_value());
        REQUIRE(err->kind == ErrorKind::Shape);
    }

    SECTION("3rd row has 8 entries") {
        auto rows = empty_rows();
        rows[2].pop_back();
        auto err = v.validate(rows);
        REQUIRE(err.has_value());
        REQUIRE(err->kind == ErrorKind::Shape);
        REQUIRE(contains(err->message, "wrong column count"));
        REQUIRE(contains(err->message, "row 3"));
        REQUIRE(err->row.value() == 2);
    }

    SECTION("shape is checked before range") {
        auto rows = empty_rows();
        rows[0][0] = 42;
        rows[5].push_back(0);
        auto err = v.validate(rows);
        REQUIRE(err.has_value());
        REQUIRE(err->kind == ErrorKind::Shape);
        REQUIRE(err->row.value() == 5);
    }
}

// ============================================================================
// Range
// ============================================================================

TEST_CASE("Validator range", "[validator][range]") {
    Validator v;
    auto rows = empty_rows();

    SECTION("value 10") {
        rows[4][6] = 10;
        auto err = v.validate(rows);
        REQUIRE(err.has_value());
        REQUIRE(err->kind == ErrorKind::Range);
        REQUIRE(contains(err->message, "value out of range"));
        REQUIRE(err->row.value() == 4);
        REQUIRE(err->col.value() == 6);
    }

    SECTION("value -1") {
        rows[0][0] = -1;
        auto err = v.validate(rows);
        REQUIRE(err.has_value());
        REQUIRE(err->kind == ErrorKind::Range);
    }

    SECTION("range is checked before conflicts") {
        rows[0][0] = 5;
        rows[0][1] = 5;
        rows[8][8] = 100;
        auto err = v.validate(rows);
        REQUIRE(err.has_value());
        REQUIRE(err->kind == ErrorKind::Range);
    }

    SECTION("boundary values are accepted") {
        rows[0][0] = 0;
        rows[0][1] = 9;
        rows[1][0] = 1;
        REQUIRE(!v.validate(rows).has_value());
    }
}

// ============================================================================
// Conflict
// ============================================================================

TEST_CASE("Validator conflicts", "[validator][conflict]") {
    Validator v;
    auto rows = empty_rows();

    SECTION("two 5s in row 0") {
        rows[0] = {5, 5, 0, 0, 0, 0, 0, 0, 0};
        auto err = v.validate(rows);
        REQUIRE(err.has_value());
        REQUIRE(err->kind == ErrorKind::Conflict);
        REQUIRE(contains(err->message, "puzzle has conflicting values"));
    }

    SECTION("same column") {
        rows[0][3] = 7;
        rows[8][3] = 7;
        auto err = v.validate(rows);
        REQUIRE(err.has_value());
        REQUIRE(err->kind == ErrorKind::Conflict);
        REQUIRE(err->row.value() == 0);
        REQUIRE(err->col.value() == 3);
    }

    SECTION("same box only") {
        rows[3][3] = 2;
        rows[5][5] = 2;
        auto err = v.validate(rows);
        REQUIRE(err.has_value());
        REQUIRE(err->kind == ErrorKind::Conflict);
    }

    SECTION("distinct digits do not conflict") {
        rows[0] = {1, 2, 3, 4, 5, 6, 7, 8, 9};
        rows[1] = {4, 5, 6, 7, 8, 9, 1, 2, 3};
        REQUIRE(!v.validate(rows).has_value());
    }

    SECTION("empty grid is valid") {
        REQUIRE(!v.validate(rows).has_value());
    }
}

// ============================================================================
// Side effects
// ============================================================================

TEST_CASE("Validator is idempotent and leaves the grid untouched", "[validator]") {
    Validator v;

    SECTION("valid grid") {
        auto rows = empty_rows();
        rows[0] = {5, 3, 0, 0, 7, 0, 0, 0, 0};
        rows[1] = {6, 0, 0, 1, 9, 5, 0, 0, 0};
        const auto original = rows;

        auto first = v.validate(rows);
        auto second = v.validate(rows);
        REQUIRE(!first.has_value());
        REQUIRE(!second.has_value());
        REQUIRE(rows == original);

        auto grid = Grid::from_rows(rows);
        const auto before = grid;
        REQUIRE(!v.check_conflicts(grid).has_value());
        REQUIRE(grid == before);
    }

    SECTION("conflicting grid") {
        auto rows = empty_rows();
        rows[0] = {5, 0, 0, 0, 0, 0, 0, 0, 5};
        rows[4][4] = 1;
        const auto original = rows;

        auto first = v.validate(rows);
        auto second = v.validate(rows);
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        REQUIRE(first->kind == second->kind);
        REQUIRE(first->message == second->message);
        REQUIRE(rows == original);

        // 矛盾を見つけたセルも元の値に戻っていること
        auto grid = Grid::from_rows(rows);
        const auto before = grid;
        REQUIRE(v.check_conflicts(grid).has_value());
        REQUIRE(grid == before);
    }
}

TEST_CASE("Validator hands back the validated grid", "[validator]") {
    Validator v;
    auto rows = empty_rows();
    rows[0] = {5, 3, 0, 0, 7, 0, 0, 0, 0};
    rows[8][8] = 9;

    SECTION("valid input") {
        Grid working;
        REQUIRE(!v.validate(rows, working).has_value());
        REQUIRE(working == Grid::from_rows(rows));
        REQUIRE(working.at(0, 4) == 7);
        REQUIRE(working.count_empty() == 77);
    }

    SECTION("conflicting input leaves the grid restored") {
        rows[0][8] = 5;
        Grid working;
        auto err = v.validate(rows, working);
        REQUIRE(err.has_value());
        REQUIRE(err->kind == ErrorKind::Conflict);
        REQUIRE(working == Grid::from_rows(rows));
    }

    SECTION("same verdict as the single-argument form") {
        rows[2].pop_back();
        Grid working;
        auto with_grid = v.validate(rows, working);
        auto without_grid = v.validate(rows);
        REQUIRE(with_grid.has_value());
        REQUIRE(without_grid.has_value());
        REQUIRE(with_grid->kind == without_grid->kind);
        REQUIRE(with_grid->message == without_grid->message);
    }
}

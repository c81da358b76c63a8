#include "nanpure/puzzle/puzzle.hpp"
#include "puzzle_parser.hpp"
#include "parser.hpp"
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace nanpure {
namespace puzzle {

void finish_row(ParserContext& ctx) {
    if (ctx.current.size() != Grid::N) {
        ctx.errors.push_back("Row " + std::to_string(ctx.line_no) + " has "
                             + std::to_string(ctx.current.size()) + " values, expected 9.");
    }
    ctx.rows.push_back(std::move(ctx.current));
    ctx.current.clear();
}

namespace {

/**
 * @brief パース結果を PuzzleText にまとめる（行数の検査を含む）
 */
PuzzleText build_result(int result, ParserContext& ctx) {
    if (result != 0 || ctx.has_error) {
        throw std::runtime_error("Parse error: " + ctx.error_message);
    }

    if (ctx.rows.size() != Grid::N) {
        ctx.errors.push_back("Puzzle has " + std::to_string(ctx.rows.size())
                             + " rows, expected 9.");
    }

    return PuzzleText{std::move(ctx.rows), std::move(ctx.errors)};
}

}  // namespace

PuzzleText parse_file(const std::string& filename) {
    FILE* file = fopen(filename.c_str(), "r");
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    yyscan_t scanner;
    yylex_init(&scanner);
    yyset_in(file, scanner);

    ParserContext ctx;
    int result = yyparse(scanner, &ctx);

    yylex_destroy(scanner);
    fclose(file);

    return build_result(result, ctx);
}

PuzzleText parse_string(const std::string& input) {
    yyscan_t scanner;
    yylex_init(&scanner);

    YY_BUFFER_STATE buffer = yy_scan_string(input.c_str(), scanner);

    ParserContext ctx;
    int result = yyparse(scanner, &ctx);

    yy_delete_buffer(buffer, scanner);
    yylex_destroy(scanner);

    return build_result(result, ctx);
}

} // namespace puzzle
} // namespace nanpure

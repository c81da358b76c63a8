#include "nanpure/puzzle/catalog.hpp"
#include "nanpure/puzzle/puzzle.hpp"
#include "nanpure/solver.hpp"
#include <cstring>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-s] [-v] [-l] [-d DIR] [FILE ...]\n";
    std::cerr << "  -s      Print solver statistics to stderr\n";
    std::cerr << "  -v      Verbose mode (print validation/search progress)\n";
    std::cerr << "  -l      List the puzzles of DIR without solving (with -d)\n";
    std::cerr << "  -d DIR  Solve every .txt puzzle in DIR\n";
    std::cerr << "  FILE    Puzzle text file (\"-\" reads standard input)\n";
    std::cerr << "  -h      Show this help\n";
}

bool g_print_stats = false;
bool g_verbose = false;

void print_stats(const nanpure::Solver& solver) {
    if (!g_print_stats) return;
    const auto& s = solver.stats();
    std::cerr << "Stats: nodes=" << s.node_count
              << " backtracks=" << s.backtrack_count
              << " max_depth=" << s.max_depth
              << " empty=" << s.empty_cells
              << "\n";
}

void print_grid(const nanpure::Grid& grid) {
    using nanpure::Grid;
    for (size_t r = 0; r < Grid::N; ++r) {
        if (r > 0 && r % Grid::BOX == 0) std::cout << "------+-------+------\n";
        for (size_t c = 0; c < Grid::N; ++c) {
            if (c > 0 && c % Grid::BOX == 0) std::cout << "| ";
            auto v = grid.at(r, c);
            std::cout << (v == Grid::EMPTY ? '.' : static_cast<char>('0' + v)) << " ";
        }
        std::cout << "\n";
    }
}

/**
 * @brief 解析済みの行をそのまま表示（9×9 に整形できない場合用）
 */
void print_rows(const nanpure::RawGrid& rows) {
    for (const auto& row : rows) {
        bool first = true;
        for (auto v : row) {
            if (!first) std::cout << " ";
            first = false;
            std::cout << v;
        }
        std::cout << "\n";
    }
}

/**
 * @brief 1問を解いて結果を表示
 * @return 解けたら true
 */
bool solve_puzzle(const std::string& name, const std::string& file,
                  const nanpure::puzzle::PuzzleText& text) {
    std::cout << "== " << name << " (" << file << ")\n";

    if (!text.ok()) {
        print_rows(text.rows);
        for (const auto& err : text.errors) {
            std::cout << "Error: " << err << "\n";
        }
        return false;
    }

    nanpure::Solver solver;
    solver.set_verbose(g_verbose);
    auto outcome = solver.solve(text.rows);
    print_stats(solver);

    // 値域外の値を含む盤面は Grid にできないので行のまま表示
    if (!outcome.ok() && outcome.error().kind == nanpure::ErrorKind::Range) {
        print_rows(text.rows);
    } else {
        print_grid(nanpure::Grid::from_rows(text.rows));
    }

    if (outcome.ok()) {
        std::cout << "Solved:\n";
        print_grid(outcome.grid());
        return true;
    }
    std::cout << "Error: " << outcome.error().message << "\n";
    return false;
}

int main(int argc, char* argv[]) {
    bool list_only = false;
    const char* dir = nullptr;
    std::vector<std::string> files;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            g_verbose = true;
        } else if (std::strcmp(argv[i], "-l") == 0) {
            list_only = true;
        } else if (std::strcmp(argv[i], "-d") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "-d requires DIR\n";
                print_usage(argv[0]);
                return 1;
            }
            dir = argv[++i];
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strcmp(argv[i], "-") == 0 || argv[i][0] != '-') {
            files.emplace_back(argv[i]);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!dir && files.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    if (list_only && !dir) {
        std::cerr << "-l requires -d DIR\n";
        return 1;
    }

    bool all_solved = true;
    try {
        if (dir) {
            auto entries = nanpure::puzzle::list_puzzles(dir);
            if (list_only) {
                for (const auto& entry : entries) {
                    std::cout << entry.name << "\t" << entry.file << "\n";
                }
                return 0;
            }
            for (const auto& entry : entries) {
                auto text = nanpure::puzzle::parse_file(nanpure::puzzle::puzzle_path(dir, entry));
                all_solved = solve_puzzle(entry.name, entry.file, text) && all_solved;
            }
        }

        for (const auto& file : files) {
            if (file == "-") {
                std::string input((std::istreambuf_iterator<char>(std::cin)),
                                  std::istreambuf_iterator<char>());
                all_solved = solve_puzzle("stdin", "-", nanpure::puzzle::parse_string(input))
                             && all_solved;
            } else {
                all_solved = solve_puzzle(std::filesystem::path(file).stem().string(), file,
                                          nanpure::puzzle::parse_file(file))
                             && all_solved;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return all_solved ? 0 : 2;
}

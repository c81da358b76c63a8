#include "nanpure/puzzle/catalog.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <stdexcept>

namespace fs = std::filesystem;

namespace nanpure {
namespace puzzle {

namespace {

/**
 * @brief 名前の先頭の整数を読む（先頭空白・符号を許す）
 * @return 整数で始まらなければ std::nullopt
 */
std::optional<long double> leading_integer(const std::string& name) {
    size_t pos = 0;
    while (pos < name.size() && std::isspace(static_cast<unsigned char>(name[pos]))) {
        ++pos;
    }

    bool negative = false;
    if (pos < name.size() && (name[pos] == '+' || name[pos] == '-')) {
        negative = name[pos] == '-';
        ++pos;
    }

    size_t start = pos;
    long double value = 0;
    while (pos < name.size() && name[pos] >= '0' && name[pos] <= '9') {
        value = value * 10 + (name[pos] - '0');
        ++pos;
    }
    if (pos == start) {
        return std::nullopt;
    }
    return negative ? -value : value;
}

}  // namespace

bool entry_name_less(const std::string& a, const std::string& b) {
    auto a_num = leading_integer(a);
    auto b_num = leading_integer(b);

    // 整数で始まる名前を先に並べる（混在時も全順序になるように）
    if (a_num.has_value() != b_num.has_value()) {
        return a_num.has_value();
    }
    if (a_num && *a_num != *b_num) {
        return *a_num < *b_num;
    }
    return a < b;
}

std::vector<PuzzleEntry> list_puzzles(const std::string& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw std::runtime_error("Not a directory: " + dir);
    }

    std::vector<PuzzleEntry> entries;
    for (const auto& item : fs::directory_iterator(dir)) {
        if (!item.is_regular_file() || item.path().extension() != ".txt") {
            continue;
        }
        entries.push_back(PuzzleEntry{item.path().stem().string(), item.path().filename().string()});
    }

    std::sort(entries.begin(), entries.end(), [](const PuzzleEntry& a, const PuzzleEntry& b) {
        return entry_name_less(a.name, b.name);
    });
    return entries;
}

std::string puzzle_path(const std::string& dir, const PuzzleEntry& entry) {
    return (fs::path(dir) / entry.file).string();
}

} // namespace puzzle
} // namespace nanpure

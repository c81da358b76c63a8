/**
 * @file error.hpp
 * @brief 求解エラーと求解結果の型
 */
#ifndef NANPURE_ERROR_HPP
#define NANPURE_ERROR_HPP

#include "nanpure/grid.hpp"
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace nanpure {

/**
 * @brief エラーの種類
 */
enum class ErrorKind {
    Shape,       // 行数または列数が9でない
    Range,       // 値が [0, 9] の範囲外
    Conflict,    // 初期配置の時点で行・列・ブロックに重複がある
    Unsolvable   // 矛盾はないが完成形が存在しない
};

/**
 * @brief エラー種別の名前を取得
 */
const char* to_string(ErrorKind kind);

/**
 * @brief 求解エラー
 *
 * message はそのまま利用者に表示できる文言。
 * row / col は該当箇所が特定できる場合のみ設定される（0始まり）。
 */
struct SolveError {
    ErrorKind kind;
    std::string message;
    std::optional<size_t> row;
    std::optional<size_t> col;
};

/**
 * @brief 求解結果（完成した盤面またはエラーのどちらか一方）
 */
class SolveOutcome {
public:
    static SolveOutcome success(Grid grid) { return SolveOutcome(std::move(grid)); }
    static SolveOutcome failure(SolveError error) { return SolveOutcome(std::move(error)); }

    /**
     * @brief 解が得られたか
     */
    bool ok() const { return std::holds_alternative<Grid>(value_); }

    /**
     * @brief 解を取得
     * @pre ok() == true
     */
    const Grid& grid() const { return std::get<Grid>(value_); }

    /**
     * @brief エラーを取得
     * @pre ok() == false
     */
    const SolveError& error() const { return std::get<SolveError>(value_); }

private:
    explicit SolveOutcome(Grid grid) : value_(std::move(grid)) {}
    explicit SolveOutcome(SolveError error) : value_(std::move(error)) {}

    std::variant<Grid, SolveError> value_;
};

} // namespace nanpure

#endif // NANPURE_ERROR_HPP

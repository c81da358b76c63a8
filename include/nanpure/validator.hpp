/**
 * @file validator.hpp
 * @brief 入力盤面の検証（形状・値域・初期矛盾）
 */
#ifndef NANPURE_VALIDATOR_HPP
#define NANPURE_VALIDATOR_HPP

#include "nanpure/grid.hpp"
#include "nanpure/error.hpp"
#include <optional>

namespace nanpure {

/**
 * @brief 探索前に入力を検証するクラス
 *
 * 以下の順に検査し、最初に見つかった問題で打ち切る:
 * 1. 行数が9であること（Shape）
 * 2. 各行の値が9個であること（Shape）
 * 3. 全ての値が [0, 9] であること（Range）
 * 4. 非0セル同士が行・列・ブロックで重複しないこと（Conflict）
 *
 * 状態を持たないため、同じインスタンスを繰り返し使ってよい。
 */
class Validator {
public:
    /**
     * @brief 全ての検査を順に実行
     * @param rows 入力盤面（変更しない）
     * @return 問題がなければ std::nullopt、あればそのエラー
     */
    std::optional<SolveError> validate(const RawGrid& rows) const;

    /**
     * @brief 全ての検査を順に実行し、検証済みの盤面を返す
     * @param rows 入力盤面（変更しない）
     * @param working 成功時に rows を変換した作業盤面を格納（失敗時は未規定）
     */
    std::optional<SolveError> validate(const RawGrid& rows, Grid& working) const;

    /**
     * @brief 行数・列数の検査
     */
    std::optional<SolveError> check_shape(const RawGrid& rows) const;

    /**
     * @brief 値域の検査
     * @pre check_shape() が成功していること
     */
    std::optional<SolveError> check_range(const RawGrid& rows) const;

    /**
     * @brief 初期配置の矛盾検査
     *
     * 非0セルを1つずつ一時的に空け、元の値を戻せるかを
     * can_place() で確認してから値を復元する。
     * 復元は次のセルを調べる前（矛盾を見つけた場合も）に行うため、
     * 結果に関わらず grid は呼び出し前と同一のまま返る。
     *
     * @param grid 検査対象の盤面（一時的に書き換えるが必ず復元する）
     */
    std::optional<SolveError> check_conflicts(Grid& grid) const;
};

} // namespace nanpure

#endif // NANPURE_VALIDATOR_HPP

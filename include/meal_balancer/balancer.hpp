/**
 * @file balancer.hpp
 * @brief 解決 → 計画 → 割当 → 検証 のパイプライン
 */
#ifndef MEAL_BALANCER_BALANCER_HPP
#define MEAL_BALANCER_BALANCER_HPP

#include "meal_balancer/assigner.hpp"
#include "meal_balancer/validator.hpp"
#include <optional>
#include <vector>
#include <cstdint>

namespace meal_balancer {

/**
 * @brief パイプラインの設定
 *
 * random_source が設定されていれば seed より優先する。
 * どちらもなければ std::random_device でシードする。
 */
struct BalanceOptions {
    bool verbose = false;
    TieBreak tie_break = TieBreak::DeclarationOrder;
    std::optional<uint32_t> seed;
    RandomSourcePtr random_source;
};

/**
 * @brief パイプラインの結果
 */
struct BalanceResult {
    Assignment assignment;
    std::vector<Warning> warnings;
    AssignerStats stats;
};

/**
 * @brief 参加者をグループに割り当てる
 *
 * 設定エラーは割当開始前に送出され、部分的な結果は返さない。
 *
 * @throws ConfigurationError 入力の設定エラー
 * @throws InvariantViolation 割当結果が不変条件を満たさない場合
 */
BalanceResult balance(const std::vector<PersonDecl>& persons,
                      const std::vector<GroupDecl>& groups,
                      const BalanceOptions& options = BalanceOptions());

} // namespace meal_balancer

#endif // MEAL_BALANCER_BALANCER_HPP

/**
 * @file validator.hpp
 * @brief 割当結果の事後条件チェック
 */
#ifndef MEAL_BALANCER_VALIDATOR_HPP
#define MEAL_BALANCER_VALIDATOR_HPP

#include "meal_balancer/assignment.hpp"
#include <vector>
#include <string>

namespace meal_balancer {

/**
 * @brief 警告の種類
 */
enum class WarningKind {
    CapacityExceeded,  // 固定参加者により上限を超えた
    SizeSkew           // 同じ食事の種類でサイズ差が 2 以上
};

/**
 * @brief 割当結果に添付する警告
 *
 * CapacityExceeded: group, ceiling, size, amount (= size - ceiling)
 * SizeSkew: meal の最大グループを group、amount に最大 - 最小
 */
struct Warning {
    WarningKind kind;
    std::string group;
    MealKind meal;
    size_t ceiling = 0;
    size_t size = 0;
    size_t amount = 0;

    std::string message() const;
};

/**
 * @brief 割当結果を検証
 *
 * (a) 全参加者がちょうど1回ずつメンバー列に現れる
 * (b) 割当先が参加可能集合に含まれる
 * (c) CapacityExceeded がなければ、昼食・夕食それぞれで最大 - 最小 <= 1。
 *     CapacityExceeded があれば (c) は緩め、超過したグループと超過量を報告する
 *
 * @return 警告のリスト（宣言順）
 * @throws InvariantViolation (a) または (b) に違反した場合
 */
std::vector<Warning> validate(const Assignment& assignment);

} // namespace meal_balancer

#endif // MEAL_BALANCER_VALIDATOR_HPP

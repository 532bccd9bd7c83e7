/**
 * @file planner.hpp
 * @brief グループサイズ計画（目標上限の計算）
 */
#ifndef MEAL_BALANCER_PLANNER_HPP
#define MEAL_BALANCER_PLANNER_HPP

#include "meal_balancer/group.hpp"
#include <vector>
#include <string>
#include <cstddef>

namespace meal_balancer {

/**
 * @brief グループごとの目標上限
 *
 * ceilings[i] は宣言順 i 番目のグループの上限。
 */
struct SizePlan {
    size_t base = 0;        // floor(N / G)
    size_t remainder = 0;   // N mod G
    std::vector<size_t> ceilings;

    size_t ceiling(size_t group_idx) const { return ceilings[group_idx]; }

    /**
     * @brief 上限の合計（= 参加者数）
     */
    size_t total() const;
};

/**
 * @brief 参加者数とグループ集合から目標上限を計算
 *
 * base = floor(N / G) を全グループに与え、余り (N mod G) を
 * 昼食グループ → 夕食グループの順、それぞれ宣言順に1ずつ配る。
 * 夕食が +1 を受け取るのは全昼食グループが受け取った後のみ。
 *
 * @param person_count 参加者数 N
 * @param groups グループ集合
 * @throws NoGroupsDefined グループが空の場合
 */
SizePlan plan_group_sizes(size_t person_count, const GroupUniverse& groups);

} // namespace meal_balancer

#endif // MEAL_BALANCER_PLANNER_HPP

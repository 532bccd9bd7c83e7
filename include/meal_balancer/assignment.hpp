/**
 * @file assignment.hpp
 * @brief 割当結果
 */
#ifndef MEAL_BALANCER_ASSIGNMENT_HPP
#define MEAL_BALANCER_ASSIGNMENT_HPP

#include "meal_balancer/group.hpp"
#include "meal_balancer/person.hpp"
#include "meal_balancer/planner.hpp"
#include <vector>
#include <string>
#include <cstddef>

namespace meal_balancer {

/**
 * @brief 割当結果（グループ → メンバー列、参加者 → グループ）
 *
 * Assigner が構築する。メンバー列は割当順。
 * capacity_exceeded はサイズ計画の上限を固定参加者が超えさせたグループの印。
 */
class Assignment {
public:
    Assignment(std::vector<Person> persons, GroupUniverse groups, SizePlan plan);

    const std::vector<Person>& persons() const { return persons_; }
    const GroupUniverse& groups() const { return groups_; }
    const SizePlan& plan() const { return plan_; }

    /**
     * @brief 参加者をグループに追加
     */
    void place(size_t person_idx, size_t group_idx);

    /**
     * @brief グループに CapacityExceeded の印を付ける
     */
    void flag_capacity_exceeded(size_t group_idx) { capacity_exceeded_[group_idx] = true; }

    bool capacity_exceeded(size_t group_idx) const { return capacity_exceeded_[group_idx]; }

    /**
     * @brief 印の付いたグループが1つでもあるか
     */
    bool any_capacity_exceeded() const;

    /**
     * @brief 参加者の割当先インデックス（未割当なら SIZE_MAX）
     */
    size_t group_of(size_t person_idx) const { return person_to_group_[person_idx]; }

    /**
     * @brief 名前から割当先グループを検索
     * @return 見つからなければ nullptr
     */
    const Group* group_of(const std::string& person_name) const;

    /**
     * @brief グループのメンバー名（割当順）
     */
    std::vector<std::string> member_names(size_t group_idx) const;

    /**
     * @brief 各グループのサイズ（宣言順）
     */
    std::vector<size_t> sizes() const;

private:
    std::vector<Person> persons_;
    GroupUniverse groups_;
    SizePlan plan_;
    std::vector<size_t> person_to_group_;
    std::vector<bool> capacity_exceeded_;
};

} // namespace meal_balancer

#endif // MEAL_BALANCER_ASSIGNMENT_HPP

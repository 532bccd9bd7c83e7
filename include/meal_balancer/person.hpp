/**
 * @file person.hpp
 * @brief 参加者と参加可能集合
 */
#ifndef MEAL_BALANCER_PERSON_HPP
#define MEAL_BALANCER_PERSON_HPP

#include <string>
#include <vector>
#include <cstddef>

namespace meal_balancer {

/**
 * @brief 参加者の制約宣言
 *
 * Unrestricted なら groups は無視される。
 * Restricted なら groups に参加可能なグループIDを並べる。
 */
struct ConstraintSpec {
    enum class Kind { Unrestricted, Restricted };
    Kind kind = Kind::Unrestricted;
    std::vector<std::string> groups;

    static ConstraintSpec unrestricted() { return ConstraintSpec{}; }

    static ConstraintSpec restricted(std::vector<std::string> groups) {
        return ConstraintSpec{Kind::Restricted, std::move(groups)};
    }
};

/**
 * @brief 入力境界で受け取る (名前, 制約) の組
 */
struct PersonDecl {
    std::string name;
    ConstraintSpec constraint;
};

/**
 * @brief 参加者（解決済み）
 *
 * eligible はグループの宣言順インデックスを昇順・重複なしで保持する。
 * 作成後は変更しない。
 */
class Person {
public:
    Person(std::string name, std::vector<size_t> eligible, bool flexible);

    const std::string& name() const { return name_; }

    const std::vector<size_t>& eligible() const { return eligible_; }

    /**
     * @brief 参加可能集合が全グループと一致するか（flexible）
     */
    bool is_flexible() const { return flexible_; }

    /**
     * @brief グループに参加可能か
     */
    bool can_join(size_t group_idx) const;

private:
    std::string name_;
    std::vector<size_t> eligible_;
    bool flexible_;
};

} // namespace meal_balancer

#endif // MEAL_BALANCER_PERSON_HPP

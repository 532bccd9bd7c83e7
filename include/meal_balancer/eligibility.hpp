/**
 * @file eligibility.hpp
 * @brief 参加可能集合の解決
 */
#ifndef MEAL_BALANCER_ELIGIBILITY_HPP
#define MEAL_BALANCER_ELIGIBILITY_HPP

#include "meal_balancer/group.hpp"
#include "meal_balancer/person.hpp"
#include <vector>

namespace meal_balancer {

/**
 * @brief 各参加者の制約宣言を参加可能集合に解決する
 *
 * - Unrestricted: 全グループ
 * - Restricted: 指定されたグループ（重複は除去、宣言順に整列）
 *
 * 制限付きでも全グループを指定していれば flexible として扱う。
 * 入力順を保持し、副作用はない。
 *
 * @param decls 入力順の (名前, 制約) リスト
 * @param groups グループ集合
 * @return 解決済みの参加者リスト（入力順）
 * @throws UnknownGroupReference 存在しないグループを参照した場合
 * @throws EmptyRestriction 制限付きなのにグループ指定が空の場合
 * @throws DuplicatePerson 同名の参加者が複数ある場合
 */
std::vector<Person> resolve_eligibility(const std::vector<PersonDecl>& decls,
                                        const GroupUniverse& groups);

} // namespace meal_balancer

#endif // MEAL_BALANCER_ELIGIBILITY_HPP

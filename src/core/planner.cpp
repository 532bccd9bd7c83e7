#include "meal_balancer/planner.hpp"
#include "meal_balancer/errors.hpp"
#include <numeric>
#include <initializer_list>

namespace meal_balancer {

size_t SizePlan::total() const {
    return std::accumulate(ceilings.begin(), ceilings.end(), size_t{0});
}

SizePlan plan_group_sizes(size_t person_count, const GroupUniverse& groups) {
    if (groups.empty()) {
        throw NoGroupsDefined();
    }

    SizePlan plan;
    plan.base = person_count / groups.size();
    plan.remainder = person_count % groups.size();
    plan.ceilings.assign(groups.size(), plan.base);

    // 余りは昼食 → 夕食の順に、それぞれ宣言順で1ずつ
    size_t rem = plan.remainder;
    for (MealKind kind : {MealKind::Lunch, MealKind::Dinner}) {
        for (const auto& group : groups.groups()) {
            if (rem == 0) {
                return plan;
            }
            if (group.kind() == kind) {
                plan.ceilings[group.index()]++;
                rem--;
            }
        }
    }

    return plan;
}

} // namespace meal_balancer

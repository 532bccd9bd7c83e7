#include "meal_balancer/assigner.hpp"
#include "meal_balancer/errors.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace meal_balancer {

Assigner::Assigner() = default;

void Assigner::set_random_source(RandomSourcePtr source) {
    if (!source) {
        throw std::invalid_argument("Random source must not be null");
    }
    random_ = std::move(source);
}

void Assigner::set_seed(uint32_t seed) {
    random_ = std::make_shared<Mt19937RandomSource>(seed);
}

void Assigner::check_inputs(const std::vector<Person>& persons,
                            const GroupUniverse& groups,
                            const SizePlan& plan) const {
    if (groups.empty()) {
        throw NoGroupsDefined();
    }
    if (plan.ceilings.size() != groups.size()) {
        throw std::invalid_argument("Size plan does not match the group list");
    }
    for (const auto& group : groups.groups()) {
        if (group.size() != 0) {
            throw std::invalid_argument("Group already has members: " + group.id());
        }
    }
    for (const auto& person : persons) {
        if (person.eligible().empty()) {
            throw std::invalid_argument("Person has no eligible group: " + person.name());
        }
        if (person.eligible().back() >= groups.size()) {
            throw std::invalid_argument("Eligible group out of range for: " + person.name());
        }
    }
}

Assignment Assigner::assign(const std::vector<Person>& persons,
                            const GroupUniverse& groups,
                            const SizePlan& plan) {
    check_inputs(persons, groups, plan);
    stats_ = AssignerStats();

    Assignment result(persons, groups, plan);

    // fixed / flexible に分割（それぞれ入力順）
    std::vector<size_t> fixed;
    std::vector<size_t> flexible;
    for (size_t i = 0; i < persons.size(); ++i) {
        if (persons[i].is_flexible()) {
            flexible.push_back(i);
        } else {
            fixed.push_back(i);
        }
    }
    stats_.fixed_count = fixed.size();
    stats_.flexible_count = flexible.size();

    if (verbose_) {
        std::cerr << "% [verbose] assign start: " << persons.size() << " persons ("
                  << fixed.size() << " fixed, " << flexible.size() << " flexible), "
                  << groups.size() << " groups\n";
    }

    // 制約の強い順
    std::stable_sort(fixed.begin(), fixed.end(), FewerOptionsFirst(persons));

    for (size_t p : fixed) {
        size_t g = select_fixed_group(result, persons[p]);
        result.place(p, g);

        const auto& group = result.groups().at(g);
        if (group.size() > plan.ceiling(g)) {
            // 固定参加者は上限を超えても置く
            if (verbose_ && !result.capacity_exceeded(g)) {
                std::cerr << "% [verbose] " << group.id() << " exceeds its target of "
                          << plan.ceiling(g) << " (placing " << persons[p].name() << ")\n";
            }
            result.flag_capacity_exceeded(g);
            stats_.overflow_count++;
        }
    }

    for (size_t p : flexible) {
        size_t g = select_flexible_group(result);
        result.place(p, g);
    }

    if (verbose_) {
        std::cerr << "% [verbose] assign done: overflow=" << stats_.overflow_count
                  << " random_tie_breaks=" << stats_.random_tie_breaks
                  << " saturated=" << stats_.saturated_picks << "\n";
    }

    return result;
}

size_t Assigner::select_fixed_group(const Assignment& result, const Person& person) const {
    // fixed は常に宣言順で決定する
    GroupPreference preference(TieBreak::DeclarationOrder);
    auto best = best_groups(result.groups().groups(), person.eligible(), preference);
    return best.front();
}

size_t Assigner::select_flexible_group(const Assignment& result) {
    const auto& groups = result.groups().groups();
    const auto& plan = result.plan();

    std::vector<size_t> candidates;
    for (const auto& group : groups) {
        if (group.size() < plan.ceiling(group.index())) {
            candidates.push_back(group.index());
        }
    }
    if (candidates.empty()) {
        candidates = result.groups().all_indices();
        stats_.saturated_picks++;
    }

    auto best = best_groups(groups, candidates, GroupPreference(tie_break_));
    if (best.size() == 1) {
        return best.front();
    }
    stats_.random_tie_breaks++;
    if (!random_) {
        random_ = make_default_random_source();
    }
    return best[random_->pick(best.size())];
}

} // namespace meal_balancer

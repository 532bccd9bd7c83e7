#include "meal_balancer/validator.hpp"
#include "meal_balancer/errors.hpp"
#include <algorithm>
#include <initializer_list>

namespace meal_balancer {

std::string Warning::message() const {
    switch (kind) {
        case WarningKind::CapacityExceeded:
            return "group '" + group + "' exceeded its target of " + std::to_string(ceiling) +
                   " by " + std::to_string(amount) + " (size " + std::to_string(size) + ")";
        case WarningKind::SizeSkew:
            return std::string(to_string(meal)) + " groups differ in size by " +
                   std::to_string(amount) + " (largest '" + group + "')";
    }
    return "unknown warning";
}

namespace {

// (a) 全員がちょうど1回ずつ
void check_exactly_once(const Assignment& assignment) {
    const auto& persons = assignment.persons();
    std::vector<size_t> seen(persons.size(), 0);

    for (const auto& group : assignment.groups().groups()) {
        for (size_t p : group.members()) {
            if (p >= persons.size()) {
                throw InvariantViolation("group '" + group.id() + "' holds an unknown member");
            }
            seen[p]++;
        }
    }

    for (size_t i = 0; i < persons.size(); ++i) {
        if (seen[i] == 0) {
            throw InvariantViolation("person '" + persons[i].name() + "' was not assigned");
        }
        if (seen[i] > 1) {
            throw InvariantViolation("person '" + persons[i].name() + "' was assigned " +
                                     std::to_string(seen[i]) + " times");
        }
    }
}

// (b) 割当先が参加可能集合に含まれる
void check_eligibility(const Assignment& assignment) {
    const auto& persons = assignment.persons();

    for (const auto& group : assignment.groups().groups()) {
        for (size_t p : group.members()) {
            if (!persons[p].can_join(group.index())) {
                throw InvariantViolation("person '" + persons[p].name() +
                                         "' placed in ineligible group '" + group.id() + "'");
            }
            if (assignment.group_of(p) != group.index()) {
                throw InvariantViolation("person '" + persons[p].name() +
                                         "' is recorded in a different group than '" +
                                         group.id() + "'");
            }
        }
    }
}

} // namespace

std::vector<Warning> validate(const Assignment& assignment) {
    check_exactly_once(assignment);
    check_eligibility(assignment);

    std::vector<Warning> warnings;
    const auto& groups = assignment.groups().groups();
    const auto& plan = assignment.plan();

    if (assignment.any_capacity_exceeded()) {
        for (const auto& group : groups) {
            size_t ceiling = plan.ceiling(group.index());
            if (group.size() > ceiling) {
                Warning w{WarningKind::CapacityExceeded, group.id(), group.kind()};
                w.ceiling = ceiling;
                w.size = group.size();
                w.amount = group.size() - ceiling;
                warnings.push_back(w);
            }
        }
        return warnings;
    }

    // (c) 同じ食事の種類でサイズ差 <= 1
    for (MealKind kind : {MealKind::Lunch, MealKind::Dinner}) {
        const Group* smallest = nullptr;
        const Group* largest = nullptr;
        for (const auto& group : groups) {
            if (group.kind() != kind) continue;
            if (!smallest || group.size() < smallest->size()) smallest = &group;
            if (!largest || group.size() > largest->size()) largest = &group;
        }
        if (largest && largest->size() - smallest->size() > 1) {
            Warning w{WarningKind::SizeSkew, largest->id(), kind};
            w.size = largest->size();
            w.ceiling = plan.ceiling(largest->index());
            w.amount = largest->size() - smallest->size();
            warnings.push_back(w);
        }
    }

    return warnings;
}

} // namespace meal_balancer

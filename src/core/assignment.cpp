#include "meal_balancer/assignment.hpp"
#include <algorithm>
#include <cstdint>

namespace meal_balancer {

Assignment::Assignment(std::vector<Person> persons, GroupUniverse groups, SizePlan plan)
    : persons_(std::move(persons))
    , groups_(std::move(groups))
    , plan_(std::move(plan))
    , person_to_group_(persons_.size(), SIZE_MAX)
    , capacity_exceeded_(groups_.size(), false) {}

void Assignment::place(size_t person_idx, size_t group_idx) {
    groups_.at(group_idx).add_member(person_idx);
    person_to_group_[person_idx] = group_idx;
}

bool Assignment::any_capacity_exceeded() const {
    return std::find(capacity_exceeded_.begin(), capacity_exceeded_.end(), true)
        != capacity_exceeded_.end();
}

const Group* Assignment::group_of(const std::string& person_name) const {
    for (size_t i = 0; i < persons_.size(); ++i) {
        if (persons_[i].name() == person_name) {
            size_t g = person_to_group_[i];
            return g == SIZE_MAX ? nullptr : &groups_.at(g);
        }
    }
    return nullptr;
}

std::vector<std::string> Assignment::member_names(size_t group_idx) const {
    std::vector<std::string> names;
    for (size_t p : groups_.at(group_idx).members()) {
        names.push_back(persons_[p].name());
    }
    return names;
}

std::vector<size_t> Assignment::sizes() const {
    std::vector<size_t> result;
    result.reserve(groups_.size());
    for (const auto& group : groups_.groups()) {
        result.push_back(group.size());
    }
    return result;
}

} // namespace meal_balancer

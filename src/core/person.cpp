#include "meal_balancer/person.hpp"
#include <algorithm>

namespace meal_balancer {

Person::Person(std::string name, std::vector<size_t> eligible, bool flexible)
    : name_(std::move(name)), eligible_(std::move(eligible)), flexible_(flexible) {}

bool Person::can_join(size_t group_idx) const {
    return std::binary_search(eligible_.begin(), eligible_.end(), group_idx);
}

} // namespace meal_balancer

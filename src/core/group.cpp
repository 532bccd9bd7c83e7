#include "meal_balancer/group.hpp"
#include "meal_balancer/errors.hpp"
#include <cstdint>

namespace meal_balancer {

const char* to_string(MealKind kind) {
    switch (kind) {
        case MealKind::Lunch:
            return "lunch";
        case MealKind::Dinner:
            return "dinner";
    }
    return "unknown";
}

Group::Group(std::string id, MealKind kind, int day, size_t index)
    : id_(std::move(id)), kind_(kind), day_(day), index_(index) {}

GroupUniverse::GroupUniverse(const std::vector<GroupDecl>& decls) {
    groups_.reserve(decls.size());
    for (const auto& decl : decls) {
        add(decl);
    }
}

size_t GroupUniverse::add(const GroupDecl& decl) {
    if (id_to_index_.count(decl.id)) {
        throw DuplicateGroup(decl.id);
    }
    size_t idx = groups_.size();
    groups_.emplace_back(decl.id, decl.kind, decl.day, idx);
    id_to_index_[decl.id] = idx;
    return idx;
}

size_t GroupUniverse::find(const std::string& id) const {
    auto it = id_to_index_.find(id);
    if (it == id_to_index_.end()) {
        return SIZE_MAX;
    }
    return it->second;
}

std::vector<size_t> GroupUniverse::all_indices() const {
    std::vector<size_t> result(groups_.size());
    for (size_t i = 0; i < groups_.size(); ++i) {
        result[i] = i;
    }
    return result;
}

} // namespace meal_balancer

#include "meal_balancer/eligibility.hpp"
#include "meal_balancer/errors.hpp"
#include <algorithm>
#include <set>
#include <cstdint>

namespace meal_balancer {

std::vector<Person> resolve_eligibility(const std::vector<PersonDecl>& decls,
                                        const GroupUniverse& groups) {
    std::vector<Person> persons;
    persons.reserve(decls.size());
    std::set<std::string> seen;

    for (const auto& decl : decls) {
        if (!seen.insert(decl.name).second) {
            throw DuplicatePerson(decl.name);
        }

        if (decl.constraint.kind == ConstraintSpec::Kind::Unrestricted) {
            persons.emplace_back(decl.name, groups.all_indices(), true);
            continue;
        }

        if (decl.constraint.groups.empty()) {
            throw EmptyRestriction(decl.name);
        }

        std::vector<size_t> eligible;
        eligible.reserve(decl.constraint.groups.size());
        for (const auto& group_id : decl.constraint.groups) {
            size_t idx = groups.find(group_id);
            if (idx == SIZE_MAX) {
                throw UnknownGroupReference(decl.name, group_id);
            }
            eligible.push_back(idx);
        }
        std::sort(eligible.begin(), eligible.end());
        eligible.erase(std::unique(eligible.begin(), eligible.end()), eligible.end());

        // 全グループを列挙した制限は制限なしと同じ
        bool flexible = eligible.size() == groups.size();
        persons.emplace_back(decl.name, std::move(eligible), flexible);
    }

    return persons;
}

} // namespace meal_balancer

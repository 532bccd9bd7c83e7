#include "meal_balancer/balancer.hpp"
#include "meal_balancer/eligibility.hpp"
#include "meal_balancer/errors.hpp"
#include <iostream>

namespace meal_balancer {

BalanceResult balance(const std::vector<PersonDecl>& persons,
                      const std::vector<GroupDecl>& groups,
                      const BalanceOptions& options) {
    GroupUniverse universe(groups);
    if (universe.empty()) {
        throw NoGroupsDefined();
    }

    auto resolved = resolve_eligibility(persons, universe);
    auto plan = plan_group_sizes(resolved.size(), universe);

    if (options.verbose) {
        std::cerr << "% [verbose] size plan: base=" << plan.base
                  << " remainder=" << plan.remainder << "\n";
        for (const auto& group : universe.groups()) {
            std::cerr << "% [verbose]   " << group.id() << " (" << to_string(group.kind())
                      << ") target " << plan.ceiling(group.index()) << "\n";
        }
    }

    Assigner assigner;
    assigner.set_verbose(options.verbose);
    assigner.set_tie_break(options.tie_break);
    if (options.random_source) {
        assigner.set_random_source(options.random_source);
    } else if (options.seed) {
        assigner.set_seed(*options.seed);
    }

    auto assignment = assigner.assign(resolved, universe, plan);
    auto warnings = validate(assignment);

    if (options.verbose) {
        std::cerr << "% [verbose] validation done: " << warnings.size() << " warning(s)\n";
    }

    return BalanceResult{std::move(assignment), std::move(warnings), assigner.stats()};
}

} // namespace meal_balancer

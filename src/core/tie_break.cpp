#include "meal_balancer/tie_break.hpp"

namespace meal_balancer {

bool FewerOptionsFirst::operator()(size_t a, size_t b) const {
    size_t a_options = (*persons_)[a].eligible().size();
    size_t b_options = (*persons_)[b].eligible().size();
    if (a_options != b_options) {
        return a_options < b_options;
    }
    return a < b;
}

bool GroupPreference::operator()(const Group& a, const Group& b) const {
    if (a.size() != b.size()) {
        return a.size() < b.size();
    }
    if (a.kind() != b.kind()) {
        return meal_rank(a.kind()) < meal_rank(b.kind());
    }
    if (mode_ == TieBreak::DeclarationOrder) {
        return a.index() < b.index();
    }
    return false;
}

std::vector<size_t> best_groups(const std::vector<Group>& groups,
                                const std::vector<size_t>& candidates,
                                const GroupPreference& preference) {
    std::vector<size_t> best;
    for (size_t idx : candidates) {
        if (best.empty() || preference(groups[idx], groups[best.front()])) {
            best.clear();
            best.push_back(idx);
        } else if (preference.tied(groups[idx], groups[best.front()])) {
            best.push_back(idx);
        }
    }
    return best;
}

} // namespace meal_balancer

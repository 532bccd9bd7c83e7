#include "meal_balancer/text/frontend.hpp"
#include "meal_balancer/random_source.hpp"
#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

namespace meal_balancer {
namespace text {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::string read_message(std::istream& in) {
    std::string message;
    std::string line;
    int blank_run = 0;
    while (std::getline(in, line)) {
        std::string stripped = normalize_name(line);
        if (stripped == "FIN") {
            break;
        }
        if (stripped.empty()) {
            if (++blank_run >= 2) {
                break;
            }
        } else {
            blank_run = 0;
        }
        message += line;
        message += '\n';
    }
    return message;
}

std::optional<uint32_t> settle_seed(BalanceOptions& options) {
    if (options.seed) {
        options.tie_break = TieBreak::Randomized;
    }
    if (options.tie_break != TieBreak::Randomized) {
        return std::nullopt;
    }
    if (!options.seed) {
        options.seed = make_seed();
    }
    return options.seed;
}

BalanceSummary summarize(const Assignment& assignment) {
    BalanceSummary summary;
    const auto& groups = assignment.groups().groups();
    if (groups.empty()) {
        return summary;
    }

    size_t smallest = groups.front().size();
    size_t largest = groups.front().size();
    for (const auto& group : groups) {
        size_t size = group.size();
        size_t ceiling = assignment.plan().ceiling(group.index());
        summary.deviation += size > ceiling ? size - ceiling : ceiling - size;
        smallest = std::min(smallest, size);
        largest = std::max(largest, size);
    }
    summary.spread = largest - smallest;
    return summary;
}

void sort_names(std::vector<std::string>& names) {
    std::stable_sort(names.begin(), names.end(),
                     [](const std::string& a, const std::string& b) {
                         return lower(a) < lower(b);
                     });
}

void print_participants(std::ostream& out, const Roster& roster) {
    auto names = roster.participants();
    out << "=== Participants ===\n";
    out << "Total: " << names.size() << "\n\n";
    for (const auto& name : names) {
        out << " - " << name << "\n";
    }
    out << "\n";
}

void print_assignment(std::ostream& out, const Assignment& assignment) {
    const auto& groups = assignment.groups();

    out << "=== Group sizes ===\n";
    for (const auto& group : groups.groups()) {
        out << group.id() << ": " << group.size()
            << " (target " << assignment.plan().ceiling(group.index()) << ")\n";
    }
    out << "\n";

    for (const auto& group : groups.groups()) {
        out << "- " << group.id() << "\n";
        auto names = assignment.member_names(group.index());
        sort_names(names);
        for (const auto& name : names) {
            out << "  • " << name << "\n";
        }
        out << "\n";
    }
}

void print_warnings(std::ostream& out, const std::vector<Warning>& warnings) {
    for (const auto& warning : warnings) {
        out << "% [warning] " << warning.message() << "\n";
    }
}

void print_stats(std::ostream& out, const BalanceResult& result) {
    const auto& s = result.stats;
    auto summary = summarize(result.assignment);
    out << "% Stats: fixed=" << s.fixed_count
        << " flexible=" << s.flexible_count
        << " overflow=" << s.overflow_count
        << " random_ties=" << s.random_tie_breaks
        << " saturated=" << s.saturated_picks
        << " deviation=" << summary.deviation
        << " spread=" << summary.spread
        << "\n";
}

} // namespace text
} // namespace meal_balancer

#include <catch2/catch_test_macros.hpp>
#include "meal_balancer/text/frontend.hpp"
#include <sstream>

using namespace meal_balancer;
using namespace meal_balancer::text;

// ============================================================================
// read_message
// ============================================================================

TEST_CASE("read_message stops at a FIN line", "[frontend]") {
    std::istringstream in("TODO:\nAna\n  FIN \r\nLuis\n");
    REQUIRE(read_message(in) == "TODO:\nAna\n");

    std::string rest;
    REQUIRE(std::getline(in, rest));
    REQUIRE(rest == "Luis");
}

TEST_CASE("read_message stops at two blank lines", "[frontend]") {
    SECTION("two consecutive blank lines end the message") {
        std::istringstream in("TODO:\nAna\n\n\nLuis\n");
        REQUIRE(read_message(in) == "TODO:\nAna\n\n");
    }

    SECTION("whitespace-only lines count as blank") {
        std::istringstream in("Ana\n  \n\t\nLuis\n");
        REQUIRE(read_message(in) == "Ana\n  \n");
    }

    SECTION("a single blank line does not") {
        std::istringstream in("TODO:\nAna\n\n- Cena 9\nLuis\n");
        REQUIRE(read_message(in) == "TODO:\nAna\n\n- Cena 9\nLuis\n");
    }

    SECTION("blank lines separated by text do not") {
        std::istringstream in("Ana\n\nLuis\n\nMarta");
        REQUIRE(read_message(in) == "Ana\n\nLuis\n\nMarta\n");
    }
}

TEST_CASE("read_message reads to EOF", "[frontend]") {
    std::istringstream in("TODO:\nAna\nLuis");
    REQUIRE(read_message(in) == "TODO:\nAna\nLuis\n");

    std::istringstream empty("");
    REQUIRE(read_message(empty).empty());
}

// ============================================================================
// settle_seed
// ============================================================================

TEST_CASE("settle_seed", "[frontend][random]") {
    SECTION("declaration order needs no seed") {
        BalanceOptions options;
        REQUIRE(!settle_seed(options));
        REQUIRE(options.tie_break == TieBreak::DeclarationOrder);
        REQUIRE(!options.seed);
    }

    SECTION("a given seed switches to the randomized tie-break") {
        BalanceOptions options;
        options.seed = 42;
        auto seed = settle_seed(options);
        REQUIRE(seed);
        REQUIRE(*seed == 42);
        REQUIRE(options.tie_break == TieBreak::Randomized);
    }

    SECTION("randomized without a seed generates and records one") {
        BalanceOptions options;
        options.tie_break = TieBreak::Randomized;
        auto seed = settle_seed(options);
        REQUIRE(seed);
        REQUIRE(options.seed);
        REQUIRE(*options.seed == *seed);
    }

    SECTION("the recorded seed reproduces the run") {
        std::vector<GroupDecl> groups = {
            {"L1", MealKind::Lunch, 1},
            {"L2", MealKind::Lunch, 2},
            {"L3", MealKind::Lunch, 3},
        };
        std::vector<PersonDecl> decls;
        for (int i = 0; i < 11; ++i) {
            decls.push_back({"p" + std::to_string(i), ConstraintSpec::unrestricted()});
        }

        BalanceOptions first;
        first.tie_break = TieBreak::Randomized;
        auto seed = settle_seed(first);
        auto a = balance(decls, groups, first);

        BalanceOptions second;
        second.seed = *seed;
        settle_seed(second);
        auto b = balance(decls, groups, second);

        for (size_t g = 0; g < groups.size(); ++g) {
            REQUIRE(a.assignment.member_names(g) == b.assignment.member_names(g));
        }
    }
}

// ============================================================================
// Rendering
// ============================================================================

TEST_CASE("print_participants lists names case-insensitively", "[frontend]") {
    Roster roster;
    roster.add_unrestricted("luis");
    roster.add_unrestricted("Ana");
    roster.add_to_group({"D1", MealKind::Dinner, 1}, "beatriz");

    std::ostringstream out;
    print_participants(out, roster);

    REQUIRE(out.str() ==
            "=== Participants ===\n"
            "Total: 3\n"
            "\n"
            " - Ana\n"
            " - beatriz\n"
            " - luis\n"
            "\n");
}

TEST_CASE("print_assignment renders sizes and sorted members", "[frontend]") {
    std::vector<GroupDecl> groups = {
        {"L1", MealKind::Lunch, 1},
        {"D1", MealKind::Dinner, 1},
    };
    std::vector<PersonDecl> decls;
    for (const auto& name : {"luis", "Ana", "beatriz", "Marta"}) {
        decls.push_back({name, ConstraintSpec::unrestricted()});
    }
    auto result = balance(decls, groups);

    std::ostringstream out;
    print_assignment(out, result.assignment);

    // luis → L1, Ana → D1, beatriz → L1, Marta → D1
    REQUIRE(out.str() ==
            "=== Group sizes ===\n"
            "L1: 2 (target 2)\n"
            "D1: 2 (target 2)\n"
            "\n"
            "- L1\n"
            "  • beatriz\n"
            "  • luis\n"
            "\n"
            "- D1\n"
            "  • Ana\n"
            "  • Marta\n"
            "\n");
}

// ============================================================================
// Warnings and statistics
// ============================================================================

TEST_CASE("overflow shows in warnings and stats", "[frontend][capacity]") {
    std::vector<GroupDecl> groups = {
        {"L1", MealKind::Lunch, 1},
        {"D1", MealKind::Dinner, 1},
    };
    std::vector<PersonDecl> decls = {
        {"d0", ConstraintSpec::restricted({"D1"})},
        {"d1", ConstraintSpec::restricted({"D1"})},
        {"d2", ConstraintSpec::restricted({"D1"})},
        {"a", ConstraintSpec::unrestricted()},
    };
    auto result = balance(decls, groups);

    auto summary = summarize(result.assignment);
    REQUIRE(summary.deviation == 2);
    REQUIRE(summary.spread == 2);

    std::ostringstream warnings;
    print_warnings(warnings, result.warnings);
    REQUIRE(warnings.str() == "% [warning] group 'D1' exceeded its target of 2 by 1 (size 3)\n");

    std::ostringstream stats;
    print_stats(stats, result);
    REQUIRE(stats.str() ==
            "% Stats: fixed=3 flexible=1 overflow=1 random_ties=0 saturated=0"
            " deviation=2 spread=2\n");
}

TEST_CASE("summarize a balanced assignment", "[frontend]") {
    std::vector<GroupDecl> groups = {
        {"L1", MealKind::Lunch, 1},
        {"L2", MealKind::Lunch, 2},
        {"D1", MealKind::Dinner, 1},
    };
    std::vector<PersonDecl> decls;
    for (int i = 0; i < 7; ++i) {
        decls.push_back({"p" + std::to_string(i), ConstraintSpec::unrestricted()});
    }
    auto summary = summarize(balance(decls, groups).assignment);

    REQUIRE(summary.deviation == 0);
    REQUIRE(summary.spread == 1);
}

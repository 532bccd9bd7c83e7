#include <catch2/catch_test_macros.hpp>
#include "meal_balancer/tie_break.hpp"
#include <algorithm>

using namespace meal_balancer;

namespace {

Group make_group(const std::string& id, MealKind kind, size_t index, size_t size) {
    Group g(id, kind, 1, index);
    for (size_t i = 0; i < size; ++i) {
        g.add_member(i);
    }
    return g;
}

} // namespace

// ============================================================================
// FewerOptionsFirst
// ============================================================================

TEST_CASE("FewerOptionsFirst orders by option count then input order", "[tie_break]") {
    std::vector<Person> persons = {
        Person("A", {0, 1, 2}, false),
        Person("B", {1}, false),
        Person("C", {0, 2}, false),
        Person("D", {2}, false),
    };
    std::vector<size_t> order = {0, 1, 2, 3};
    std::stable_sort(order.begin(), order.end(), FewerOptionsFirst(persons));

    REQUIRE(order == std::vector<size_t>{1, 3, 2, 0});
}

// ============================================================================
// GroupPreference
// ============================================================================

TEST_CASE("GroupPreference keys", "[tie_break]") {
    GroupPreference pref;

    SECTION("smaller current size first") {
        auto small_dinner = make_group("D1", MealKind::Dinner, 1, 1);
        auto big_lunch = make_group("L1", MealKind::Lunch, 0, 2);
        REQUIRE(pref(small_dinner, big_lunch));
        REQUIRE(!pref(big_lunch, small_dinner));
    }

    SECTION("lunch before dinner at equal size") {
        auto dinner = make_group("D1", MealKind::Dinner, 0, 1);
        auto lunch = make_group("L1", MealKind::Lunch, 1, 1);
        REQUIRE(pref(lunch, dinner));
        REQUIRE(!pref(dinner, lunch));
    }

    SECTION("declaration order last") {
        auto first = make_group("L1", MealKind::Lunch, 0, 1);
        auto second = make_group("L2", MealKind::Lunch, 1, 1);
        REQUIRE(pref(first, second));
        REQUIRE(!pref(second, first));
        REQUIRE(!pref.tied(first, second));
    }
}

TEST_CASE("GroupPreference randomized mode leaves same-kind ties", "[tie_break]") {
    GroupPreference pref(TieBreak::Randomized);
    auto first = make_group("L1", MealKind::Lunch, 0, 1);
    auto second = make_group("L2", MealKind::Lunch, 1, 1);
    auto dinner = make_group("D1", MealKind::Dinner, 2, 1);

    REQUIRE(pref.tied(first, second));
    REQUIRE(pref(first, dinner));
    REQUIRE(pref(second, dinner));
}

// ============================================================================
// best_groups
// ============================================================================

TEST_CASE("best_groups", "[tie_break]") {
    std::vector<Group> groups = {
        make_group("L1", MealKind::Lunch, 0, 2),
        make_group("D1", MealKind::Dinner, 1, 1),
        make_group("L2", MealKind::Lunch, 2, 1),
        make_group("L3", MealKind::Lunch, 3, 1),
    };

    SECTION("declaration order yields one group") {
        auto best = best_groups(groups, {0, 1, 2, 3}, GroupPreference());
        REQUIRE(best == std::vector<size_t>{2});
    }

    SECTION("randomized yields every tied group") {
        auto best = best_groups(groups, {0, 1, 2, 3}, GroupPreference(TieBreak::Randomized));
        REQUIRE(best == std::vector<size_t>{2, 3});
    }

    SECTION("only candidates are considered") {
        auto best = best_groups(groups, {0, 1}, GroupPreference());
        REQUIRE(best == std::vector<size_t>{1});
    }
}

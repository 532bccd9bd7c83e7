#include <catch2/catch_test_macros.hpp>
#include "meal_balancer/validator.hpp"
#include "meal_balancer/errors.hpp"
#include <stdexcept>

using namespace meal_balancer;

namespace {

GroupUniverse two_lunches_one_dinner() {
    return GroupUniverse({
        {"L1", MealKind::Lunch, 1},
        {"L2", MealKind::Lunch, 2},
        {"D1", MealKind::Dinner, 1},
    });
}

std::vector<Person> three_flexible() {
    return {
        Person("a", {0, 1, 2}, true),
        Person("b", {0, 1, 2}, true),
        Person("c", {0, 1, 2}, true),
    };
}

SizePlan ceilings(std::vector<size_t> values) {
    SizePlan plan;
    plan.ceilings = std::move(values);
    return plan;
}

} // namespace

TEST_CASE("validate accepts a balanced assignment", "[validator]") {
    Assignment a(three_flexible(), two_lunches_one_dinner(), ceilings({1, 1, 1}));
    a.place(0, 0);
    a.place(1, 1);
    a.place(2, 2);

    REQUIRE(validate(a).empty());
}

TEST_CASE("validate detects engine defects", "[validator][error]") {
    SECTION("person never assigned") {
        Assignment a(three_flexible(), two_lunches_one_dinner(), ceilings({1, 1, 1}));
        a.place(0, 0);
        a.place(1, 1);
        REQUIRE_THROWS_AS(validate(a), InvariantViolation);
    }

    SECTION("person assigned twice") {
        Assignment a(three_flexible(), two_lunches_one_dinner(), ceilings({1, 1, 1}));
        a.place(0, 0);
        a.place(1, 1);
        a.place(2, 2);
        a.place(2, 0);
        REQUIRE_THROWS_AS(validate(a), InvariantViolation);
    }

    SECTION("hard constraint violated") {
        std::vector<Person> persons = {
            Person("a", {0, 1, 2}, true),
            Person("dinner_only", {2}, false),
        };
        Assignment a(persons, two_lunches_one_dinner(), ceilings({1, 1, 0}));
        a.place(0, 0);
        a.place(1, 1);
        REQUIRE_THROWS_AS(validate(a), InvariantViolation);
    }

    SECTION("internal errors are not configuration errors") {
        Assignment a(three_flexible(), two_lunches_one_dinner(), ceilings({1, 1, 1}));
        try {
            validate(a);
            FAIL("expected InvariantViolation");
        } catch (const ConfigurationError&) {
            FAIL("InvariantViolation must not be a ConfigurationError");
        } catch (const std::logic_error& e) {
            REQUIRE(std::string(e.what()).find("Internal error") == 0);
        }
    }
}

TEST_CASE("validate reports capacity overflow", "[validator][capacity]") {
    std::vector<Person> persons = {
        Person("d0", {2}, false),
        Person("d1", {2}, false),
        Person("d2", {2}, false),
    };
    Assignment a(persons, two_lunches_one_dinner(), ceilings({1, 1, 1}));
    a.place(0, 2);
    a.place(1, 2);
    a.place(2, 2);
    a.flag_capacity_exceeded(2);

    auto warnings = validate(a);

    // 昼食のサイズ差 (0, 0) と夕食の超過のうち、超過のみを報告する
    REQUIRE(warnings.size() == 1);
    REQUIRE(warnings[0].kind == WarningKind::CapacityExceeded);
    REQUIRE(warnings[0].group == "D1");
    REQUIRE(warnings[0].meal == MealKind::Dinner);
    REQUIRE(warnings[0].ceiling == 1);
    REQUIRE(warnings[0].size == 3);
    REQUIRE(warnings[0].amount == 2);
    REQUIRE(warnings[0].message().find("'D1'") != std::string::npos);
}

TEST_CASE("validate reports size skew without capacity flags", "[validator]") {
    Assignment a(three_flexible(), two_lunches_one_dinner(), ceilings({3, 0, 0}));
    a.place(0, 0);
    a.place(1, 0);
    a.place(2, 0);

    auto warnings = validate(a);

    REQUIRE(warnings.size() == 1);
    REQUIRE(warnings[0].kind == WarningKind::SizeSkew);
    REQUIRE(warnings[0].meal == MealKind::Lunch);
    REQUIRE(warnings[0].group == "L1");
    REQUIRE(warnings[0].amount == 3);
    REQUIRE(warnings[0].message().find("lunch") == 0);
}

TEST_CASE("validate allows a difference of one within a meal kind", "[validator]") {
    std::vector<Person> persons = {
        Person("a", {0, 1, 2}, true),
        Person("b", {0, 1, 2}, true),
        Person("c", {0, 1, 2}, true),
        Person("d", {0, 1, 2}, true),
    };
    Assignment a(persons, two_lunches_one_dinner(), ceilings({2, 1, 1}));
    a.place(0, 0);
    a.place(1, 0);
    a.place(2, 1);
    a.place(3, 2);

    REQUIRE(validate(a).empty());
}

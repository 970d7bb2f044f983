// ==============================================================================
// Layer 0: Core Tests - Error Types
// ==============================================================================
// Tests for: dsp/include/echo/dsp/core/dsp_errors.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <echo/dsp/core/dsp_errors.h>

#include <stdexcept>
#include <string>

using namespace Echo::DSP;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("DomainError reports the offending length", "[dsp][core][errors]") {
    const DomainError e(12);
    REQUIRE(e.length() == 12);
    REQUIRE_THAT(e.what(), ContainsSubstring("12"));

    SECTION("is a std::domain_error") {
        REQUIRE_THROWS_AS(throw DomainError(3), std::domain_error);
    }
}

TEST_CASE("ShapeMismatchError reports both shapes", "[dsp][core][errors]") {
    const ShapeMismatchError e(4, 8, 2, 8);
    REQUIRE(e.expectedHeight() == 4);
    REQUIRE(e.expectedWidth() == 8);
    REQUIRE(e.actualHeight() == 2);
    REQUIRE(e.actualWidth() == 8);
    REQUIRE_THAT(e.what(), ContainsSubstring("4x8"));
    REQUIRE_THAT(e.what(), ContainsSubstring("2x8"));

    SECTION("is a std::invalid_argument") {
        REQUIRE_THROWS_AS(throw ShapeMismatchError(1, 2, 1, 3), std::invalid_argument);
    }
}

TEST_CASE("IndexError reports index and size", "[dsp][core][errors]") {
    const IndexError e(5, 4);
    REQUIRE(e.index() == 5);
    REQUIRE(e.size() == 4);

    SECTION("is a std::out_of_range") {
        REQUIRE_THROWS_AS(throw IndexError(5, 4), std::out_of_range);
    }
}

TEST_CASE("ContractViolation is a std::logic_error", "[dsp][core][errors]") {
    REQUIRE_THROWS_AS(throw ContractViolation("shrink"), std::logic_error);
    REQUIRE_THROWS_WITH(throw ContractViolation("shrink"), "shrink");
}

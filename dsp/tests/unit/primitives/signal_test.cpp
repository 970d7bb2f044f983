// ==============================================================================
// Layer 1: DSP Primitive Tests - Signal
// ==============================================================================
// Tests for: dsp/include/echo/dsp/primitives/signal.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <echo/dsp/core/dsp_errors.h>
#include <echo/dsp/primitives/signal.h>

#include <complex_comparison.h>
#include <test_signals.h>

#include <cmath>
#include <vector>

using namespace Echo::DSP;
using Catch::Approx;

// ==============================================================================
// Construction and Access
// ==============================================================================

TEST_CASE("Signal is zero-initialized", "[signal][construction]") {
    const Signal s(8);
    REQUIRE(s.size() == 8);
    for (size_t i = 0; i < s.size(); ++i) {
        REQUIRE(s[i] == ComplexNumber{0.0, 0.0});
    }
}

TEST_CASE("Signal construction from samples", "[signal][construction]") {
    SECTION("initializer list keeps order") {
        const Signal s{{1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0}};
        REQUIRE(s.size() == 3);
        REQUIRE(s[0] == ComplexNumber{1.0, 2.0});
        REQUIRE(s[2] == ComplexNumber{5.0, 6.0});
    }

    SECTION("fromReal sets imaginary parts to zero") {
        const Signal s = Signal::fromReal({1.0, -2.0, 0.5});
        REQUIRE(s.size() == 3);
        REQUIRE(s[1] == ComplexNumber{-2.0, 0.0});
        REQUIRE(s[2] == ComplexNumber{0.5, 0.0});
    }

    SECTION("default signal is empty") {
        const Signal s;
        REQUIRE(s.empty());
        REQUIRE(s.size() == 0);
    }
}

TEST_CASE("Signal indexed get and set", "[signal][access]") {
    Signal s(4);
    s[2] = {7.0, -1.0};
    s.at(3) = {0.5, 0.25};

    REQUIRE(s.at(2) == ComplexNumber{7.0, -1.0});
    REQUIRE(s[3] == ComplexNumber{0.5, 0.25});
}

TEST_CASE("Signal::at rejects out-of-range indices", "[signal][access][errors]") {
    Signal s(4);
    const Signal& cs = s;

    REQUIRE_THROWS_AS(s.at(4), IndexError);
    REQUIRE_THROWS_AS(cs.at(100), IndexError);
    REQUIRE_NOTHROW(cs.at(3));

    SECTION("error carries index and size") {
        try {
            (void)s.at(9);
            FAIL("expected IndexError");
        } catch (const IndexError& e) {
            REQUIRE(e.index() == 9);
            REQUIRE(e.size() == 4);
        }
    }

    SECTION("empty signal has no valid index") {
        Signal empty;
        REQUIRE_THROWS_AS(empty.at(0), IndexError);
    }
}

// ==============================================================================
// Conjugate
// ==============================================================================

TEST_CASE("Signal::conjugate returns a new signal", "[signal][conjugate]") {
    const Signal s{{1.0, 2.0}, {-3.0, -4.0}, {5.0, 0.0}};
    const Signal c = s.conjugate();

    REQUIRE(c[0] == ComplexNumber{1.0, -2.0});
    REQUIRE(c[1] == ComplexNumber{-3.0, 4.0});
    REQUIRE(c[2].real == 5.0);
    REQUIRE(c[2].imag == 0.0);

    // Original untouched
    REQUIRE(s[0] == ComplexNumber{1.0, 2.0});
}

TEST_CASE("Signal::conjugateInPlace mutates and chains", "[signal][conjugate]") {
    Signal s{{1.0, 2.0}, {3.0, -4.0}};
    Signal& ref = s.conjugateInPlace();

    REQUIRE(&ref == &s);
    REQUIRE(s[0] == ComplexNumber{1.0, -2.0});
    REQUIRE(s[1] == ComplexNumber{3.0, 4.0});
}

// ==============================================================================
// Zero Padding
// ==============================================================================

TEST_CASE("Signal::padWithZeros", "[signal][pad]") {
    const Signal s{{1.0, 1.0}, {2.0, 2.0}, {3.0, 3.0}};

    SECTION("copies samples to low indices and zero-fills the rest") {
        const Signal p = s.padWithZeros(8);
        REQUIRE(p.size() == 8);
        REQUIRE(p[0] == ComplexNumber{1.0, 1.0});
        REQUIRE(p[2] == ComplexNumber{3.0, 3.0});
        for (size_t i = 3; i < 8; ++i) {
            REQUIRE(p[i] == ComplexNumber{0.0, 0.0});
        }
        REQUIRE(s.size() == 3);
    }

    SECTION("same length returns an equal copy") {
        const Signal p = s.padWithZeros(3);
        REQUIRE(p == s);
    }

    SECTION("shrinking is a contract violation") {
        REQUIRE_THROWS_AS(s.padWithZeros(2), ContractViolation);
        REQUIRE_THROWS_AS(s.padWithZeros(0), ContractViolation);
    }
}

// ==============================================================================
// Scalar Division
// ==============================================================================

TEST_CASE("Signal::divideByScalar mutates in place", "[signal][divide]") {
    Signal s{{4.0, -8.0}, {2.0, 6.0}, {1.0, 0.0}};
    Signal& ref = s.divideByScalar(2.0);

    REQUIRE(&ref == &s);
    REQUIRE(s[0] == ComplexNumber{2.0, -4.0});
    REQUIRE(s[1] == ComplexNumber{1.0, 3.0});
    REQUIRE(s[2] == ComplexNumber{0.5, 0.0});
}

TEST_CASE("Signal operator/ leaves the receiver unchanged", "[signal][divide]") {
    const Signal s{{4.0, -8.0}};
    const Signal d = s / 4.0;

    REQUIRE(d[0] == ComplexNumber{1.0, -2.0});
    REQUIRE(s[0] == ComplexNumber{4.0, -8.0});
}

TEST_CASE("Signal division by zero yields non-finite samples", "[signal][divide]") {
    Signal s{{1.0, 0.0}};
    s.divideByScalar(0.0);
    REQUIRE(std::isinf(s[0].real));
    REQUIRE(std::isnan(s[0].imag));
}

// ==============================================================================
// Element-wise Arithmetic
// ==============================================================================

TEST_CASE("Signal element-wise multiply", "[signal][multiply]") {
    const Signal a = TestHelpers::generateComplexNoise(37, 1);
    const Signal b = TestHelpers::generateComplexNoise(37, 2);

    const Signal product = a * b;

    REQUIRE(product.size() == 37);
    for (size_t i = 0; i < product.size(); ++i) {
        const ComplexNumber expected = a[i] * b[i];
        REQUIRE(product[i].real == Approx(expected.real).margin(1e-12));
        REQUIRE(product[i].imag == Approx(expected.imag).margin(1e-12));
    }
}

TEST_CASE("Signal addition and subtraction", "[signal][arithmetic]") {
    const Signal a{{1.0, 2.0}, {3.0, 4.0}};
    const Signal b{{0.5, -1.0}, {-3.0, 1.0}};

    REQUIRE((a + b) == Signal{{1.5, 1.0}, {0.0, 5.0}});
    REQUIRE((a - b) == Signal{{0.5, 3.0}, {6.0, 3.0}});
}

TEST_CASE("Signal element-wise ops reject mismatched lengths", "[signal][errors]") {
    const Signal a(4);
    const Signal b(8);

    REQUIRE_THROWS_AS(a * b, ShapeMismatchError);
    REQUIRE_THROWS_AS(a.multiply(b), ShapeMismatchError);
    REQUIRE_THROWS_AS(a + b, ShapeMismatchError);
    REQUIRE_THROWS_AS(a - b, ShapeMismatchError);
}

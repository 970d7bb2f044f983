// ==============================================================================
// Layer 0: Core Utility - Complex Number
// ==============================================================================
// Double-precision complex sample used by Signal, Signal2D and the Fourier
// engine. Value semantics: every operator returns a new value.
//
// Layout is two adjacent doubles {real, imag} with no padding, so a
// contiguous array of ComplexNumber can be handed to the SIMD bulk kernels in
// spectral_simd.h as interleaved double data.
// ==============================================================================

#pragma once

#include <cmath>
#include <type_traits>

namespace Echo {
namespace DSP {

/// @brief Complex sample (POD)
/// @note Division by zero follows IEEE-754 (Inf/NaN), it is not an error
struct ComplexNumber {
    double real = 0.0;  ///< Real component
    double imag = 0.0;  ///< Imaginary component

    // -------------------------------------------------------------------------
    // Arithmetic Operators
    // -------------------------------------------------------------------------

    [[nodiscard]] constexpr ComplexNumber operator+(const ComplexNumber& other) const noexcept {
        return {real + other.real, imag + other.imag};
    }

    [[nodiscard]] constexpr ComplexNumber operator-(const ComplexNumber& other) const noexcept {
        return {real - other.real, imag - other.imag};
    }

    [[nodiscard]] constexpr ComplexNumber operator*(const ComplexNumber& other) const noexcept {
        return {
            real * other.real - imag * other.imag,
            real * other.imag + imag * other.real
        };
    }

    /// @brief Scale by a real factor
    [[nodiscard]] constexpr ComplexNumber operator*(double scalar) const noexcept {
        return {real * scalar, imag * scalar};
    }

    /// @brief Divide both components by a real scalar
    [[nodiscard]] constexpr ComplexNumber operator/(double scalar) const noexcept {
        return {real / scalar, imag / scalar};
    }

    [[nodiscard]] constexpr ComplexNumber conjugate() const noexcept {
        return {real, -imag};
    }

    [[nodiscard]] constexpr bool operator==(const ComplexNumber& other) const noexcept = default;

    // -------------------------------------------------------------------------
    // Polar Representation
    // -------------------------------------------------------------------------

    /// @brief Get magnitude |z| = sqrt(real^2 + imag^2)
    [[nodiscard]] double magnitude() const noexcept {
        return std::hypot(real, imag);
    }

    /// @brief Get phase angle in radians, range [-pi, pi]
    [[nodiscard]] double phase() const noexcept {
        return std::atan2(imag, real);
    }
};

static_assert(sizeof(ComplexNumber) == 2 * sizeof(double),
              "ComplexNumber must be two packed doubles for the bulk kernels");
static_assert(std::is_standard_layout_v<ComplexNumber>,
              "ComplexNumber must be standard layout for the bulk kernels");

/// @brief Unit-magnitude complex exponential exp(i * angle)
[[nodiscard]] inline ComplexNumber polar(double angle) noexcept {
    return {std::cos(angle), std::sin(angle)};
}

} // namespace DSP
} // namespace Echo

// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Centralized mathematical constants for transform calculations.
// All DSP components should import these constants instead of defining locally.
//
// Constants are double precision: the Fourier engine works on double-valued
// complex samples and twiddle factors are computed per bin.
//
// Note: Constants are inline constexpr to ensure a single definition across
// all translation units (avoids ODR violations from multiple definitions).
// ==============================================================================

#pragma once

namespace Echo {
namespace DSP {

// =============================================================================
// Mathematical Constants
// =============================================================================

/// Pi constant for transform calculations
/// Provides full double precision: 3.14159265358979323846
inline constexpr double kPi = 3.14159265358979323846;

/// Two times Pi (full circle in radians)
/// Twiddle angle for bin k of an N-point transform: -kTwoPi * k / N
inline constexpr double kTwoPi = 2.0 * kPi;

/// Half Pi (quarter circle in radians)
inline constexpr double kHalfPi = kPi / 2.0;

} // namespace DSP
} // namespace Echo

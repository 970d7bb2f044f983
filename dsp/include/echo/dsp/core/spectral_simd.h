// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Complex Bulk Math
// ==============================================================================
// Element-wise complex arithmetic over interleaved {real, imag} double
// buffers, using Google Highway for runtime SIMD dispatch
// (SSE2/AVX2/AVX-512/NEON) with a scalar tail.
//
// Signal and Signal2D call these for their element-wise operations
// (spectrum products, conjugation, normalization). Each kernel computes
// exactly the scalar formula of the matching ComplexNumber operator; no fused
// multiply-add is used so results do not depend on the dispatched target.
// ==============================================================================

#pragma once

#include <cstddef>

namespace Echo {
namespace DSP {

/// @brief Element-wise complex product out[k] = a[k] * b[k]
/// @param a Interleaved {real, imag} pairs
/// @param b Interleaved {real, imag} pairs
/// @param out Output pairs (must hold 2*numBins doubles, may alias a or b)
/// @param numBins Number of complex values (NOT number of doubles)
/// @note SIMD-accelerated with runtime ISA dispatch
void multiplyComplexBulk(const double* a, const double* b, double* out,
                         size_t numBins) noexcept;

/// @brief In-place complex conjugate: imag[k] = -imag[k]
/// @param data Interleaved {real, imag} pairs (modified in-place)
/// @param numBins Number of complex values
/// @note SIMD-accelerated with runtime ISA dispatch
void conjugateComplexBulk(double* data, size_t numBins) noexcept;

/// @brief In-place division of every component by a real scalar
/// @param data Interleaved {real, imag} pairs (modified in-place)
/// @param numBins Number of complex values
/// @param divisor Real divisor (zero yields Inf/NaN per IEEE-754)
/// @note SIMD-accelerated with runtime ISA dispatch
void divideComplexBulk(double* data, size_t numBins, double divisor) noexcept;

} // namespace DSP
} // namespace Echo

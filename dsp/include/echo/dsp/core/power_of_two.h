// ==============================================================================
// Layer 0: Core Utility - Power-of-Two Sizes
// ==============================================================================
// Size predicates shared by the radix-2 transforms and by callers that need
// to pad their input to a supported transform length.
// ==============================================================================

#pragma once

#include <bit>
#include <cstddef>

namespace Echo {
namespace DSP {

/// @brief True if n is a non-zero power of two (1, 2, 4, 8, ...)
[[nodiscard]] constexpr bool isPowerOfTwo(size_t n) noexcept {
    return n != 0 && std::has_single_bit(n);
}

/// @brief Smallest power of two >= n
/// @note nextPowerOfTwo(0) == 1
[[nodiscard]] constexpr size_t nextPowerOfTwo(size_t n) noexcept {
    return std::bit_ceil(n);
}

} // namespace DSP
} // namespace Echo

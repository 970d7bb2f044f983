// ==============================================================================
// Layer 1: DSP Primitive - Fast Fourier Transform
// ==============================================================================
// Recursive radix-2 decimation-in-time FFT over Signal, its inverse, and the
// separable 2D extension over Signal2D.
//
// Forward transform convention: X[k] = sum_n x[n] * exp(-2*pi*i*k*n/N).
// Inverse transform: x = conj(FFT(conj(X))) / N, so inverseFft(fft(x)) == x
// for complex as well as real input.
//
// Every entry point returns a new container; inputs are never mutated. All
// transform lengths (and both 2D dimensions) must be non-zero powers of two,
// otherwise DomainError is thrown before any work is done.
// ==============================================================================

#pragma once

#include <echo/dsp/core/complex_number.h>
#include <echo/dsp/core/debug_trace.h>
#include <echo/dsp/core/dsp_errors.h>
#include <echo/dsp/core/math_constants.h>
#include <echo/dsp/core/power_of_two.h>
#include <echo/dsp/primitives/signal.h>
#include <echo/dsp/primitives/signal_2d.h>

#include <cstddef>

namespace Echo {
namespace DSP {

namespace detail {

inline void requirePowerOfTwo(size_t length, const char* operation) {
    if (!isPowerOfTwo(length)) {
        ECHO_DSP_TRACE("%s: rejecting length %zu", operation, length);
        throw DomainError(length);
    }
}

/// Radix-2 step. Caller guarantees signal.size() is a power of two.
inline Signal fftRecursive(const Signal& signal) {
    const size_t N = signal.size();
    if (N == 1) {
        return signal;
    }

    const size_t half = N / 2;
    Signal even(half);
    Signal odd(half);
    for (size_t i = 0; i < half; ++i) {
        even[i] = signal[2 * i];
        odd[i] = signal[2 * i + 1];
    }

    even = fftRecursive(even);
    odd = fftRecursive(odd);

    // Butterfly with twiddle W_k = exp(-2*pi*i*k/N)
    Signal result(N);
    for (size_t k = 0; k < half; ++k) {
        const double angle = -2.0 * static_cast<double>(k) * kPi / static_cast<double>(N);
        const ComplexNumber t = polar(angle) * odd[k];
        result[k] = even[k] + t;
        result[k + half] = even[k] - t;
    }
    return result;
}

} // namespace detail

// =============================================================================
// 1D Transforms
// =============================================================================

/// @brief Forward FFT
/// @param signal Input of power-of-two length (1 is allowed)
/// @return Spectrum with the same length
/// @throws DomainError if signal.size() is not a non-zero power of two
[[nodiscard]] inline Signal fft(const Signal& signal) {
    detail::requirePowerOfTwo(signal.size(), "fft");
    return detail::fftRecursive(signal);
}

/// @brief Inverse FFT, normalized by 1/N
/// @throws DomainError if signal.size() is not a non-zero power of two
[[nodiscard]] inline Signal inverseFft(const Signal& spectrum) {
    detail::requirePowerOfTwo(spectrum.size(), "inverseFft");
    Signal result = detail::fftRecursive(spectrum.conjugate());
    result.divideByScalar(static_cast<double>(spectrum.size()));
    result.conjugateInPlace();
    return result;
}

// =============================================================================
// 2D Transforms
// =============================================================================

/// @brief Separable 2D FFT: rows first, then columns
/// @throws DomainError if width or height is not a non-zero power of two
[[nodiscard]] inline Signal2D fft2D(const Signal2D& signal) {
    detail::requirePowerOfTwo(signal.width(), "fft2D (width)");
    detail::requirePowerOfTwo(signal.height(), "fft2D (height)");

    Signal2D result(signal.height(), signal.width());

    // rows
    for (size_t n = 0; n < signal.height(); ++n) {
        result.setRow(n, detail::fftRecursive(signal.row(n)));
    }

    // columns
    for (size_t i = 0; i < signal.width(); ++i) {
        result.setColumn(i, detail::fftRecursive(result.column(i)));
    }

    return result;
}

/// @brief Inverse 2D FFT, normalized by 1/(width*height)
/// @throws DomainError if width or height is not a non-zero power of two
[[nodiscard]] inline Signal2D inverseFft2D(const Signal2D& spectrum) {
    Signal2D result = fft2D(spectrum.conjugate());
    result.divideByScalar(static_cast<double>(spectrum.width() * spectrum.height()));
    result.conjugateInPlace();
    return result;
}

} // namespace DSP
} // namespace Echo

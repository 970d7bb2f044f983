// ==============================================================================
// Layer 2: DSP Processor - Spectral Correlation and Convolution
// ==============================================================================
// Frequency-domain cross-correlation (1D and 2D) and convolution built on the
// radix-2 FFT.
//
// Algorithm (correlation theorem):
//   crossCorrelation(x, y)[k] = IFFT(FFT(x) * conj(FFT(y)))[k]
//                             = sum_n x[(n + k) mod N] * conj(y[n])
// Algorithm (convolution theorem):
//   crossConvolution(s, h)[k] = IFFT(FFT(s) * FFT(h))[k]
//                             = sum_n s[n] * h[(k - n) mod N]
//
// Both are circular. Operands are zero-padded only to a common length; for a
// linear result the caller pads both to >= len(x) + len(y) - 1 first (see
// nextPowerOfTwo() in power_of_two.h).
// ==============================================================================

#pragma once

#include <echo/dsp/core/debug_trace.h>
#include <echo/dsp/core/dsp_errors.h>
#include <echo/dsp/primitives/fft.h>
#include <echo/dsp/primitives/signal.h>
#include <echo/dsp/primitives/signal_2d.h>

#include <algorithm>
#include <cstddef>

namespace Echo::DSP {

namespace detail {

/// Delay by `lag` samples within the same length; the tail falls off the end.
inline Signal delaySamples(const Signal& signal, size_t lag) {
    Signal shifted(signal.size());
    for (size_t i = lag; i < signal.size(); ++i) {
        shifted[i] = signal[i - lag];
    }
    return shifted;
}

} // namespace detail

/// @brief Circular cross-correlation of two signals via the FFT
///
/// The shorter operand is zero-padded to the longer length, which must then be
/// a power of two.
///
/// @param x Reference signal (e.g. received response)
/// @param y Signal correlated against x (e.g. transmitted pulse)
/// @param lag Delay applied to the padded y before transforming. Samples
///            shifted past the end are dropped; lag >= length gives zeros.
/// @return r[k] = sum_n x[(n + k) mod N] * conj(y'[n]), y' the delayed y
/// @throws DomainError if the common length is not a power of two
[[nodiscard]] inline Signal crossCorrelation(const Signal& x, const Signal& y, size_t lag = 0) {
    const size_t length = std::max(x.size(), y.size());
    const Signal xPadded = x.padWithZeros(length);
    Signal yPadded = y.padWithZeros(length);
    if (lag > 0) {
        yPadded = detail::delaySamples(yPadded, lag);
    }

    const Signal xSpectrum = fft(xPadded);
    Signal ySpectrum = fft(yPadded);
    ySpectrum.conjugateInPlace();

    return inverseFft(xSpectrum * ySpectrum);
}

/// @brief Circular convolution of a signal with a filter via the FFT
/// @param signal Signal to filter, power-of-two length
/// @param filter Filter kernel, zero-padded to signal.size()
/// @throws ContractViolation if filter is longer than signal
/// @throws DomainError if signal.size() is not a power of two
[[nodiscard]] inline Signal crossConvolution(const Signal& signal, const Signal& filter) {
    const Signal filterSpectrum = fft(filter.padWithZeros(signal.size()));
    const Signal signalSpectrum = fft(signal);
    return inverseFft(signalSpectrum * filterSpectrum);
}

/// @brief Circular 2D cross-correlation of a response grid with a pulse grid
///
/// Computes IFFT2D(conj(FFT2D(pulse)) * FFT2D(signal)). A peak at (r, c)
/// means the pulse best matches the signal shifted by r rows and c columns.
///
/// @throws ShapeMismatchError if signal and pulse differ in shape
/// @throws DomainError if a dimension is not a power of two
[[nodiscard]] inline Signal2D crossCorrelation2D(const Signal2D& signal, const Signal2D& pulse) {
    if (!signal.sameShape(pulse)) {
        ECHO_DSP_TRACE("crossCorrelation2D: signal %zux%zu vs pulse %zux%zu",
                       signal.height(), signal.width(), pulse.height(), pulse.width());
        throw ShapeMismatchError(signal.height(), signal.width(), pulse.height(), pulse.width());
    }

    Signal2D pulseSpectrum = fft2D(pulse);
    pulseSpectrum.conjugateInPlace();

    return inverseFft2D(pulseSpectrum * fft2D(signal));
}

} // namespace Echo::DSP

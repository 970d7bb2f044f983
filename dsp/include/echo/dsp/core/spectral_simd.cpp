// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Complex Bulk Math
// ==============================================================================
// Element-wise complex kernels using Google Highway for runtime SIMD dispatch
// (SSE2/AVX2/AVX-512/NEON).
//
// This file uses Highway's self-inclusion pattern: foreach_target.h re-includes
// this file once per ISA target. The SIMD kernels compile for each target;
// HWY_EXPORT/HWY_DYNAMIC_DISPATCH (inside #if HWY_ONCE) select the best at
// runtime.
// ==============================================================================

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "echo/dsp/core/spectral_simd.cpp"
#include "hwy/foreach_target.h"  // NOLINT(misc-header-include-cycle) Highway self-inclusion by design
#include "hwy/highway.h"

#include <cstddef>

// =============================================================================
// Per-Target SIMD Kernels (compiled once per ISA target)
// =============================================================================

HWY_BEFORE_NAMESPACE();

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE is a macro
namespace Echo {
namespace DSP {
namespace HWY_NAMESPACE {

namespace hn = hwy::HWY_NAMESPACE;

// -----------------------------------------------------------------------------
// MultiplyComplexImpl: out[k] = a[k] * b[k]
// -----------------------------------------------------------------------------
// out may alias a or b: every lane is loaded before the store of its block.

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void MultiplyComplexImpl(const double* a, const double* b, double* out,
                         size_t numBins) {
    const hn::ScalableTag<double> d;
    const size_t N = hn::Lanes(d);

    size_t k = 0;

    // SIMD loop: process N bins per iteration
    for (; k + N <= numBins; k += N) {
        hn::Vec<decltype(d)> aRe;
        hn::Vec<decltype(d)> aIm;
        hn::Vec<decltype(d)> bRe;
        hn::Vec<decltype(d)> bIm;
        hn::LoadInterleaved2(d, a + k * 2, aRe, aIm);
        hn::LoadInterleaved2(d, b + k * 2, bRe, bIm);

        // (ar*br - ai*bi, ar*bi + ai*br)
        const auto re = hn::Sub(hn::Mul(aRe, bRe), hn::Mul(aIm, bIm));
        const auto im = hn::Add(hn::Mul(aRe, bIm), hn::Mul(aIm, bRe));

        hn::StoreInterleaved2(re, im, d, out + k * 2);
    }

    // Scalar tail for remaining bins
    for (; k < numBins; ++k) {
        const double ar = a[k * 2];
        const double ai = a[k * 2 + 1];
        const double br = b[k * 2];
        const double bi = b[k * 2 + 1];
        out[k * 2] = ar * br - ai * bi;
        out[k * 2 + 1] = ar * bi + ai * br;
    }
}

// -----------------------------------------------------------------------------
// ConjugateComplexImpl: imag[k] = -imag[k]
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void ConjugateComplexImpl(double* HWY_RESTRICT data, size_t numBins) {
    const hn::ScalableTag<double> d;
    const size_t N = hn::Lanes(d);

    size_t k = 0;
    for (; k + N <= numBins; k += N) {
        hn::Vec<decltype(d)> re;
        hn::Vec<decltype(d)> im;
        hn::LoadInterleaved2(d, data + k * 2, re, im);
        hn::StoreInterleaved2(re, hn::Neg(im), d, data + k * 2);
    }
    // Scalar tail
    for (; k < numBins; ++k) {
        data[k * 2 + 1] = -data[k * 2 + 1];
    }
}

// -----------------------------------------------------------------------------
// DivideComplexImpl: data[i] /= divisor over all 2*numBins doubles
// -----------------------------------------------------------------------------
// Real and imaginary parts are divided identically, so the buffer is treated
// as a flat array of doubles.

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void DivideComplexImpl(double* HWY_RESTRICT data, size_t numBins, double divisor) {
    const hn::ScalableTag<double> d;
    const size_t N = hn::Lanes(d);
    const size_t count = numBins * 2;
    const auto div = hn::Set(d, divisor);

    size_t k = 0;
    for (; k + N <= count; k += N) {
        const auto v = hn::LoadU(d, data + k);
        hn::StoreU(hn::Div(v, div), d, data + k);
    }
    // Scalar tail
    for (; k < count; ++k) {
        data[k] = data[k] / divisor;
    }
}

}  // namespace HWY_NAMESPACE
}  // namespace DSP
}  // namespace Echo

HWY_AFTER_NAMESPACE();

// =============================================================================
// Dispatch Table + Wrapper Functions (compiled once)
// =============================================================================

#if HWY_ONCE

#include "echo/dsp/core/spectral_simd.h"

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE dispatch section
namespace Echo {
namespace DSP {

HWY_EXPORT(MultiplyComplexImpl);
HWY_EXPORT(ConjugateComplexImpl);
HWY_EXPORT(DivideComplexImpl);

void multiplyComplexBulk(const double* a, const double* b, double* out,
                         size_t numBins) noexcept {
    HWY_DYNAMIC_DISPATCH(MultiplyComplexImpl)(a, b, out, numBins);
}

void conjugateComplexBulk(double* data, size_t numBins) noexcept {
    HWY_DYNAMIC_DISPATCH(ConjugateComplexImpl)(data, numBins);
}

void divideComplexBulk(double* data, size_t numBins, double divisor) noexcept {
    HWY_DYNAMIC_DISPATCH(DivideComplexImpl)(data, numBins, divisor);
}

}  // namespace DSP
}  // namespace Echo

#endif  // HWY_ONCE

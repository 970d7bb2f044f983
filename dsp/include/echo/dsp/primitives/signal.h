// ==============================================================================
// Layer 1: DSP Primitive - Signal
// ==============================================================================
// Fixed-length sequence of complex samples, the 1D container consumed and
// produced by the Fourier engine.
//
// Design decisions:
// - Samples live in one contiguous std::vector<ComplexNumber>, which is
//   interleaved {real, imag} doubles. Element-wise operations go through the
//   SIMD bulk kernels in spectral_simd.h.
// - Two operation shapes per transformation: pure (returns a new Signal,
//   e.g. conjugate(), operator/) and explicit in-place (mutates and returns
//   *this for chaining, e.g. conjugateInPlace(), divideByScalar()).
// - operator[] is unchecked; at() throws IndexError.
// - Length changes (padWithZeros) always produce a new Signal.
// ==============================================================================

#pragma once

#include <echo/dsp/core/complex_number.h>
#include <echo/dsp/core/dsp_errors.h>
#include <echo/dsp/core/spectral_simd.h>

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace Echo {
namespace DSP {

/// @brief Fixed-length ordered sequence of complex samples
class Signal {
public:
    Signal() noexcept = default;

    /// @brief Create a signal of `length` zero samples
    explicit Signal(size_t length)
        : samples_(length) {}

    Signal(std::initializer_list<ComplexNumber> samples)
        : samples_(samples) {}

    explicit Signal(std::vector<ComplexNumber> samples) noexcept
        : samples_(std::move(samples)) {}

    /// @brief Create a signal from real samples (imaginary parts zero)
    [[nodiscard]] static Signal fromReal(const std::vector<double>& values) {
        Signal result(values.size());
        for (size_t i = 0; i < values.size(); ++i) {
            result.samples_[i] = {values[i], 0.0};
        }
        return result;
    }

    // -------------------------------------------------------------------------
    // Access
    // -------------------------------------------------------------------------

    [[nodiscard]] size_t size() const noexcept { return samples_.size(); }
    [[nodiscard]] bool empty() const noexcept { return samples_.empty(); }

    [[nodiscard]] ComplexNumber& operator[](size_t i) noexcept { return samples_[i]; }
    [[nodiscard]] const ComplexNumber& operator[](size_t i) const noexcept { return samples_[i]; }

    /// @brief Checked access
    /// @throws IndexError if i >= size()
    [[nodiscard]] ComplexNumber& at(size_t i) {
        requireIndex(i);
        return samples_[i];
    }

    [[nodiscard]] const ComplexNumber& at(size_t i) const {
        requireIndex(i);
        return samples_[i];
    }

    [[nodiscard]] ComplexNumber* data() noexcept { return samples_.data(); }
    [[nodiscard]] const ComplexNumber* data() const noexcept { return samples_.data(); }

    [[nodiscard]] auto begin() noexcept { return samples_.begin(); }
    [[nodiscard]] auto end() noexcept { return samples_.end(); }
    [[nodiscard]] auto begin() const noexcept { return samples_.begin(); }
    [[nodiscard]] auto end() const noexcept { return samples_.end(); }

    [[nodiscard]] bool operator==(const Signal& other) const noexcept {
        return samples_ == other.samples_;
    }

    // -------------------------------------------------------------------------
    // Length Changes
    // -------------------------------------------------------------------------

    /// @brief Copy into a longer signal, filling the new tail with zeros
    /// @param newLength Target length, must be >= size()
    /// @throws ContractViolation if newLength < size()
    [[nodiscard]] Signal padWithZeros(size_t newLength) const {
        if (newLength < samples_.size()) {
            throw ContractViolation("padWithZeros cannot shrink a signal from "
                                    + std::to_string(samples_.size()) + " to "
                                    + std::to_string(newLength) + " samples");
        }
        Signal result(newLength);
        std::copy(samples_.begin(), samples_.end(), result.samples_.begin());
        return result;
    }

    // -------------------------------------------------------------------------
    // Element-wise Operations
    // -------------------------------------------------------------------------

    /// @brief New signal with every imaginary part negated
    [[nodiscard]] Signal conjugate() const {
        Signal result(*this);
        result.conjugateInPlace();
        return result;
    }

    /// @brief Negate every imaginary part in place
    Signal& conjugateInPlace() noexcept {
        conjugateComplexBulk(rawData(), samples_.size());
        return *this;
    }

    /// @brief Divide every sample by a real scalar in place
    /// @note Used to normalize inverse transforms
    Signal& divideByScalar(double scalar) noexcept {
        divideComplexBulk(rawData(), samples_.size(), scalar);
        return *this;
    }

    [[nodiscard]] Signal operator/(double scalar) const {
        Signal result(*this);
        result.divideByScalar(scalar);
        return result;
    }

    /// @brief Element-wise complex product
    /// @throws ShapeMismatchError if lengths differ
    [[nodiscard]] Signal multiply(const Signal& other) const {
        requireSameLength(other);
        Signal result(samples_.size());
        multiplyComplexBulk(rawData(), other.rawData(), result.rawData(), samples_.size());
        return result;
    }

    [[nodiscard]] Signal operator*(const Signal& other) const { return multiply(other); }

    /// @throws ShapeMismatchError if lengths differ
    [[nodiscard]] Signal operator+(const Signal& other) const {
        requireSameLength(other);
        Signal result(samples_.size());
        for (size_t i = 0; i < samples_.size(); ++i) {
            result.samples_[i] = samples_[i] + other.samples_[i];
        }
        return result;
    }

    /// @throws ShapeMismatchError if lengths differ
    [[nodiscard]] Signal operator-(const Signal& other) const {
        requireSameLength(other);
        Signal result(samples_.size());
        for (size_t i = 0; i < samples_.size(); ++i) {
            result.samples_[i] = samples_[i] - other.samples_[i];
        }
        return result;
    }

private:
    [[nodiscard]] double* rawData() noexcept {
        return reinterpret_cast<double*>(samples_.data());
    }

    [[nodiscard]] const double* rawData() const noexcept {
        return reinterpret_cast<const double*>(samples_.data());
    }

    void requireIndex(size_t i) const {
        if (i >= samples_.size()) {
            throw IndexError(i, samples_.size());
        }
    }

    void requireSameLength(const Signal& other) const {
        if (other.samples_.size() != samples_.size()) {
            throw ShapeMismatchError(1, samples_.size(), 1, other.samples_.size());
        }
    }

    std::vector<ComplexNumber> samples_;
};

} // namespace DSP
} // namespace Echo

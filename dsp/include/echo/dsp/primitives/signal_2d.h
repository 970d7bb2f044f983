// ==============================================================================
// Layer 1: DSP Primitive - Signal2D
// ==============================================================================
// Rectangular grid of complex samples (height rows x width columns), the 2D
// container of the Fourier engine.
//
// Design decisions:
// - Row-major storage in a single contiguous buffer, so element-wise
//   operations run through the same SIMD bulk kernels as Signal.
// - Rows and columns are exchanged with the engine as independent Signal
//   copies (row()/column()) and written back with setRow()/setColumn().
// - Same pure / in-place split as Signal.
// ==============================================================================

#pragma once

#include <echo/dsp/core/complex_number.h>
#include <echo/dsp/core/dsp_errors.h>
#include <echo/dsp/core/spectral_simd.h>
#include <echo/dsp/primitives/signal.h>

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <vector>

namespace Echo {
namespace DSP {

/// @brief Grid of complex samples with fixed height and width
class Signal2D {
public:
    Signal2D() noexcept = default;

    /// @brief Create a height x width grid of zero samples
    Signal2D(size_t height, size_t width)
        : height_(height)
        , width_(width)
        , samples_(height * width) {}

    /// @brief Create a grid from equal-length rows
    /// @throws ShapeMismatchError if the rows differ in length
    Signal2D(std::initializer_list<Signal> rows)
        : Signal2D(std::vector<Signal>(rows)) {}

    /// @throws ShapeMismatchError if the rows differ in length
    explicit Signal2D(const std::vector<Signal>& rows)
        : height_(rows.size())
        , width_(rows.empty() ? 0 : rows.front().size()) {
        samples_.resize(height_ * width_);
        for (size_t r = 0; r < height_; ++r) {
            setRow(r, rows[r]);
        }
    }

    // -------------------------------------------------------------------------
    // Shape and Access
    // -------------------------------------------------------------------------

    [[nodiscard]] size_t height() const noexcept { return height_; }
    [[nodiscard]] size_t width() const noexcept { return width_; }

    /// @brief Total number of samples (height * width)
    [[nodiscard]] size_t size() const noexcept { return samples_.size(); }

    [[nodiscard]] bool sameShape(const Signal2D& other) const noexcept {
        return height_ == other.height_ && width_ == other.width_;
    }

    /// @brief Unchecked access
    [[nodiscard]] ComplexNumber& operator()(size_t row, size_t col) noexcept {
        return samples_[row * width_ + col];
    }

    [[nodiscard]] const ComplexNumber& operator()(size_t row, size_t col) const noexcept {
        return samples_[row * width_ + col];
    }

    /// @brief Checked access
    /// @throws IndexError if row >= height() or col >= width()
    [[nodiscard]] ComplexNumber& at(size_t row, size_t col) {
        requireRow(row);
        requireColumn(col);
        return samples_[row * width_ + col];
    }

    [[nodiscard]] const ComplexNumber& at(size_t row, size_t col) const {
        requireRow(row);
        requireColumn(col);
        return samples_[row * width_ + col];
    }

    [[nodiscard]] ComplexNumber* data() noexcept { return samples_.data(); }
    [[nodiscard]] const ComplexNumber* data() const noexcept { return samples_.data(); }

    [[nodiscard]] bool operator==(const Signal2D& other) const noexcept {
        return sameShape(other) && samples_ == other.samples_;
    }

    // -------------------------------------------------------------------------
    // Rows and Columns
    // -------------------------------------------------------------------------

    /// @brief Copy of row r as a Signal of length width()
    /// @throws IndexError if r >= height()
    [[nodiscard]] Signal row(size_t r) const {
        requireRow(r);
        const auto first = samples_.begin() + static_cast<std::ptrdiff_t>(r * width_);
        return Signal(std::vector<ComplexNumber>(first, first + static_cast<std::ptrdiff_t>(width_)));
    }

    /// @throws IndexError if r >= height()
    /// @throws ShapeMismatchError if values.size() != width()
    void setRow(size_t r, const Signal& values) {
        requireRow(r);
        if (values.size() != width_) {
            throw ShapeMismatchError(1, width_, 1, values.size());
        }
        std::copy(values.begin(), values.end(),
                  samples_.begin() + static_cast<std::ptrdiff_t>(r * width_));
    }

    /// @brief Copy of column c as a Signal of length height()
    /// @throws IndexError if c >= width()
    [[nodiscard]] Signal column(size_t c) const {
        requireColumn(c);
        Signal result(height_);
        for (size_t r = 0; r < height_; ++r) {
            result[r] = samples_[r * width_ + c];
        }
        return result;
    }

    /// @throws IndexError if c >= width()
    /// @throws ShapeMismatchError if values.size() != height()
    void setColumn(size_t c, const Signal& values) {
        requireColumn(c);
        if (values.size() != height_) {
            throw ShapeMismatchError(height_, 1, values.size(), 1);
        }
        for (size_t r = 0; r < height_; ++r) {
            samples_[r * width_ + c] = values[r];
        }
    }

    // -------------------------------------------------------------------------
    // Element-wise Operations
    // -------------------------------------------------------------------------

    [[nodiscard]] Signal2D conjugate() const {
        Signal2D result(*this);
        result.conjugateInPlace();
        return result;
    }

    Signal2D& conjugateInPlace() noexcept {
        conjugateComplexBulk(rawData(), samples_.size());
        return *this;
    }

    Signal2D& divideByScalar(double scalar) noexcept {
        divideComplexBulk(rawData(), samples_.size(), scalar);
        return *this;
    }

    [[nodiscard]] Signal2D operator/(double scalar) const {
        Signal2D result(*this);
        result.divideByScalar(scalar);
        return result;
    }

    /// @brief Element-wise complex product: result(i,j) = a(i,j) * b(i,j)
    /// @throws ShapeMismatchError if shapes differ
    [[nodiscard]] Signal2D multiply(const Signal2D& other) const {
        if (!sameShape(other)) {
            throw ShapeMismatchError(height_, width_, other.height_, other.width_);
        }
        Signal2D result(height_, width_);
        multiplyComplexBulk(rawData(), other.rawData(), result.rawData(), samples_.size());
        return result;
    }

    [[nodiscard]] Signal2D operator*(const Signal2D& other) const { return multiply(other); }

private:
    [[nodiscard]] double* rawData() noexcept {
        return reinterpret_cast<double*>(samples_.data());
    }

    [[nodiscard]] const double* rawData() const noexcept {
        return reinterpret_cast<const double*>(samples_.data());
    }

    void requireRow(size_t r) const {
        if (r >= height_) throw IndexError(r, height_);
    }

    void requireColumn(size_t c) const {
        if (c >= width_) throw IndexError(c, width_);
    }

    size_t height_ = 0;
    size_t width_ = 0;
    std::vector<ComplexNumber> samples_;
};

} // namespace DSP
} // namespace Echo

// ==============================================================================
// Layer 0: Core Utility - Error Types
// ==============================================================================
// Exceptions thrown by the containers and the Fourier engine when a caller
// violates a precondition. Errors are raised at the violating call and are
// never caught inside the library.
//
//   DomainError         - transform length/dimension is not a power of two
//   ShapeMismatchError  - element-wise operation on differently shaped data
//   IndexError          - sample, row or column index out of range
//   ContractViolation   - padWithZeros() asked to shrink a signal
//
// Each type derives from the closest standard exception so callers may catch
// either the specific type or the std:: family.
// ==============================================================================

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace Echo {
namespace DSP {

/// @brief Transform size is not a non-zero power of two
class DomainError : public std::domain_error {
public:
    explicit DomainError(size_t length)
        : std::domain_error("transform length must be a non-zero power of 2, got "
                            + std::to_string(length))
        , length_(length) {}

    /// @brief Offending length
    [[nodiscard]] size_t length() const noexcept { return length_; }

private:
    size_t length_;
};

/// @brief Two operands of an element-wise operation have different shapes
///
/// 1D operands report a height of 1.
class ShapeMismatchError : public std::invalid_argument {
public:
    ShapeMismatchError(size_t expectedHeight, size_t expectedWidth,
                       size_t actualHeight, size_t actualWidth)
        : std::invalid_argument("shape mismatch: expected "
                                + std::to_string(expectedHeight) + "x" + std::to_string(expectedWidth)
                                + ", got "
                                + std::to_string(actualHeight) + "x" + std::to_string(actualWidth))
        , expectedHeight_(expectedHeight)
        , expectedWidth_(expectedWidth)
        , actualHeight_(actualHeight)
        , actualWidth_(actualWidth) {}

    [[nodiscard]] size_t expectedHeight() const noexcept { return expectedHeight_; }
    [[nodiscard]] size_t expectedWidth() const noexcept { return expectedWidth_; }
    [[nodiscard]] size_t actualHeight() const noexcept { return actualHeight_; }
    [[nodiscard]] size_t actualWidth() const noexcept { return actualWidth_; }

private:
    size_t expectedHeight_;
    size_t expectedWidth_;
    size_t actualHeight_;
    size_t actualWidth_;
};

/// @brief Index outside [0, size)
class IndexError : public std::out_of_range {
public:
    IndexError(size_t index, size_t size)
        : std::out_of_range("index " + std::to_string(index)
                            + " out of range for size " + std::to_string(size))
        , index_(index)
        , size_(size) {}

    [[nodiscard]] size_t index() const noexcept { return index_; }
    [[nodiscard]] size_t size() const noexcept { return size_; }

private:
    size_t index_;
    size_t size_;
};

/// @brief Operation called with arguments its contract forbids
class ContractViolation : public std::logic_error {
public:
    explicit ContractViolation(const std::string& what)
        : std::logic_error(what) {}
};

} // namespace DSP
} // namespace Echo

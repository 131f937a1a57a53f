/**
 * @file error.hpp
 * @brief Error classes raised by layout operations
 */

#ifndef LAYOUT_ALGEBRA_CORE_ERROR_HPP
#define LAYOUT_ALGEBRA_CORE_ERROR_HPP

#include <stdexcept>
#include <string>
#include "types.hpp"

namespace layout_algebra {

/**
 * @brief Base class of every error thrown by the library
 */
class LayoutError : public std::runtime_error {
public:
    explicit LayoutError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief An IntTuple accessor was applied to the wrong node kind
 */
class TypeError : public LayoutError {
public:
    explicit TypeError(const std::string& message) : LayoutError(message) {}
};

/**
 * @enum StructureErrorKind
 * @brief Reason a pair of trees is not isomorphic
 */
enum class StructureErrorKind {
    TYPE_MISMATCH,   // scalar on one side, tuple on the other
    ARITY_MISMATCH,  // both tuples, different lengths
    EMPTY_TUPLE      // tuple without children
};

/**
 * @brief Shape/stride isomorphism violated
 *
 * path() names the offending position, e.g. "[1][0]", or is empty for the root.
 */
class StructureError : public LayoutError {
public:
    StructureError(StructureErrorKind kind, const std::string& path, const std::string& message)
        : LayoutError(message), kind_(kind), path_(path) {}

    StructureErrorKind kind() const { return kind_; }
    const std::string& path() const { return path_; }

private:
    StructureErrorKind kind_;
    std::string path_;
};

/**
 * @brief Number of supplied layouts does not match a layout's top-level modes
 */
class ArityError : public StructureError {
public:
    ArityError(dim_t expected, dim_t actual)
        : StructureError(StructureErrorKind::ARITY_MISMATCH, "",
                         "Number of mode layouts (" + std::to_string(actual) +
                         ") must match number of top-level modes in layout (" +
                         std::to_string(expected) + ")"),
          expected_(expected), actual_(actual) {}

    dim_t expected() const { return expected_; }
    dim_t actual() const { return actual_; }

private:
    dim_t expected_;
    dim_t actual_;
};

/**
 * @brief Flat value count does not match a template's leaf count
 */
class LengthMismatchError : public LayoutError {
public:
    explicit LengthMismatchError(const std::string& message) : LayoutError(message) {}
};

/**
 * @brief Divide could not split the layout exactly
 */
class DivisibilityError : public LayoutError {
public:
    explicit DivisibilityError(const std::string& message) : LayoutError(message) {}
};

/**
 * @brief Index or offset outside its valid range
 */
class RangeError : public LayoutError {
public:
    explicit RangeError(const std::string& message) : LayoutError(message) {}
};

/**
 * @brief Coordinate and stride have different flattened lengths
 */
class DimensionMismatchError : public LayoutError {
public:
    explicit DimensionMismatchError(const std::string& message) : LayoutError(message) {}
};

/**
 * @enum ParseErrorKind
 * @brief Syntax error categories of the layout text parser
 */
enum class ParseErrorKind {
    EMPTY_INPUT,
    MISSING_SEPARATOR,
    MULTIPLE_SEPARATORS,
    MISSING_OPERAND,
    INVALID_CHARACTER,
    UNBALANCED_PARENTHESES,
    EMPTY_PARENTHESES,
    EMPTY_ELEMENT,
    INVALID_INTEGER,
    UNEXPECTED_TOKEN,
    DEPTH_EXCEEDED
};

/**
 * @brief Layout text rejected by the parser
 */
class ParseError : public LayoutError {
public:
    ParseError(ParseErrorKind kind, const std::string& message)
        : LayoutError("Format error: " + message), kind_(kind) {}

    ParseErrorKind kind() const { return kind_; }

private:
    ParseErrorKind kind_;
};

} // namespace layout_algebra

#endif // LAYOUT_ALGEBRA_CORE_ERROR_HPP

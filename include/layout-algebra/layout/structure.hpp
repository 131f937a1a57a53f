/**
 * @file structure.hpp
 * @brief Shape/stride isomorphism checks
 */

#ifndef LAYOUT_ALGEBRA_LAYOUT_STRUCTURE_HPP
#define LAYOUT_ALGEBRA_LAYOUT_STRUCTURE_HPP

#include <string>
#include "int_tuple.hpp"
#include "../core/error.hpp"
#include "../utils/debug.hpp"

namespace layout_algebra {

namespace detail {

inline void validate_congruent(const IntTuple& shape, const IntTuple& stride,
                               const std::string& path) {
    if (shape.kind() != stride.kind()) {
        throw StructureError(StructureErrorKind::TYPE_MISMATCH, path,
                             "Structure mismatch at " + (path.empty() ? std::string("root") : path) +
                             ": shape is " + node_kind_name(shape.kind()) +
                             ", stride is " + node_kind_name(stride.kind()));
    }
    if (shape.is_leaf()) {
        return;
    }
    if (shape.rank() != stride.rank()) {
        throw StructureError(StructureErrorKind::ARITY_MISMATCH, path,
                             "Structure mismatch at " + (path.empty() ? std::string("root") : path) +
                             ": shape has " + std::to_string(shape.rank()) +
                             " elements, stride has " + std::to_string(stride.rank()) + " elements");
    }
    for (dim_t i = 0; i < shape.rank(); ++i) {
        validate_congruent(shape[i], stride[i], path + "[" + std::to_string(i) + "]");
    }
}

} // namespace detail

/**
 * @brief Validate that shape and stride have matching structure
 * @param shape Shape tree
 * @param stride Stride tree
 * @throws StructureError naming the first mismatching position
 *
 * Extents are not checked for sign; zero or negative extents give a
 * degenerate layout of size <= 0 but are accepted.
 */
inline void validate_layout(const Shape& shape, const Stride& stride) {
    try {
        detail::validate_congruent(shape, stride, "");
    } catch (const StructureError& e) {
        LAYOUT_WARNING("Rejected layout ", shape, ":", stride, " - ", e.what());
        throw;
    }
}

/**
 * @brief Check whether two trees have identical nesting
 * @return true if both are leaves, or tuples of equal rank with congruent elements
 */
inline bool is_congruent(const IntTuple& a, const IntTuple& b) {
    if (a.kind() != b.kind()) {
        return false;
    }
    if (a.is_leaf()) {
        return true;
    }
    if (a.rank() != b.rank()) {
        return false;
    }
    for (dim_t i = 0; i < a.rank(); ++i) {
        if (!is_congruent(a[i], b[i])) {
            return false;
        }
    }
    return true;
}

} // namespace layout_algebra

#endif // LAYOUT_ALGEBRA_LAYOUT_STRUCTURE_HPP

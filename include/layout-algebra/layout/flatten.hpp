/**
 * @file flatten.hpp
 * @brief Conversion between nested trees and flat leaf sequences
 */

#ifndef LAYOUT_ALGEBRA_LAYOUT_FLATTEN_HPP
#define LAYOUT_ALGEBRA_LAYOUT_FLATTEN_HPP

#include <string>
#include <vector>
#include "int_tuple.hpp"
#include "structure.hpp"
#include "../core/error.hpp"
#include "../utils/debug.hpp"

namespace layout_algebra {

/**
 * @struct FlatLayout
 * @brief Shape and stride leaves in pre-order, one entry per leaf
 */
struct FlatLayout {
    std::vector<index_t> shape;
    std::vector<index_t> stride;

    size_t size() const { return shape.size(); }

    bool operator==(const FlatLayout& other) const {
        return shape == other.shape && stride == other.stride;
    }
    bool operator!=(const FlatLayout& other) const { return !(*this == other); }
};

namespace detail {

inline void flatten_into(const IntTuple& tree, std::vector<index_t>& out) {
    if (tree.is_leaf()) {
        out.push_back(tree.value());
        return;
    }
    for (const auto& child : tree.children()) {
        flatten_into(child, out);
    }
}

inline IntTuple unflatten_from(const std::vector<index_t>& values, size_t& cursor,
                               const IntTuple& tmpl) {
    if (tmpl.is_leaf()) {
        LAYOUT_ASSERT(cursor < values.size(), "flat values exhausted at ", tmpl);
        return IntTuple(values[cursor++]);
    }
    std::vector<IntTuple> children;
    children.reserve(tmpl.children().size());
    for (const auto& child : tmpl.children()) {
        children.push_back(unflatten_from(values, cursor, child));
    }
    return IntTuple(std::move(children));
}

} // namespace detail

/**
 * @brief Flatten a tree into its leaves, left to right
 *
 * 5 -> [5], (4,8) -> [4,8], (12,(4,8)) -> [12,4,8]
 */
inline std::vector<index_t> flatten(const IntTuple& tree) {
    std::vector<index_t> out;
    out.reserve(tree.leaf_count());
    detail::flatten_into(tree, out);
    return out;
}

/**
 * @brief Flatten a shape/stride pair
 * @throws StructureError if shape and stride are not isomorphic
 */
inline FlatLayout flatten_layout(const Shape& shape, const Stride& stride) {
    validate_layout(shape, stride);
    return FlatLayout{flatten(shape), flatten(stride)};
}

/**
 * @brief Rebuild the nesting of a template with new leaf values
 * @param values Leaf values in pre-order
 * @param tmpl Tree whose structure is reproduced
 * @return Tree congruent to tmpl
 * @throws LengthMismatchError if values.size() differs from the leaf count of tmpl
 */
inline IntTuple unflatten(const std::vector<index_t>& values, const IntTuple& tmpl) {
    size_t expected = tmpl.leaf_count();
    if (values.size() != expected) {
        throw LengthMismatchError("Flat tuple length " + std::to_string(values.size()) +
                                  " doesn't match template structure " + tmpl.to_string() +
                                  " (expected " + std::to_string(expected) + " elements)");
    }
    size_t cursor = 0;
    return detail::unflatten_from(values, cursor, tmpl);
}

} // namespace layout_algebra

#endif // LAYOUT_ALGEBRA_LAYOUT_FLATTEN_HPP

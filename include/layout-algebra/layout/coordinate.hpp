/**
 * @file coordinate.hpp
 * @brief Index-space size, coordinate enumeration and offset arithmetic
 */

#ifndef LAYOUT_ALGEBRA_LAYOUT_COORDINATE_HPP
#define LAYOUT_ALGEBRA_LAYOUT_COORDINATE_HPP

#include <limits>
#include <string>
#include <utility>
#include <vector>
#include "int_tuple.hpp"
#include "flatten.hpp"
#include "../core/config.hpp"
#include "../core/error.hpp"

namespace layout_algebra {

namespace detail {

// a * b, or RangeError if the product does not fit in index_t
inline index_t checked_multiply(index_t a, index_t b, const Shape& shape) {
    constexpr index_t max_value = std::numeric_limits<index_t>::max();
    constexpr index_t min_value = std::numeric_limits<index_t>::min();
    bool overflow = false;
    if (a > 0) {
        overflow = b > 0 ? a > max_value / b : b < min_value / a;
    } else if (a < 0) {
        overflow = b > 0 ? a < min_value / b : (b != 0 && b < max_value / a);
    }
    if (overflow) {
        throw RangeError("Extent product of shape " + shape.to_string() +
                         " overflows the index type");
    }
    return a * b;
}

inline index_t size_of(const Shape& mode, const Shape& root) {
    if (mode.is_leaf()) {
        return mode.value();
    }
    index_t result = 1;
    for (const auto& child : mode.children()) {
        result = checked_multiply(result, size_of(child, root), root);
    }
    return result;
}

} // namespace detail

/**
 * @brief Total number of points in the index space of a shape
 * @param shape Shape tree
 * @return Product of all leaf extents
 * @throws RangeError if the product overflows index_t
 *
 * 12 -> 12, (4,8) -> 32, (12,(4,8)) -> 384
 */
inline index_t size(const Shape& shape) {
    return detail::size_of(shape, shape);
}

namespace detail {

// Column-major Cartesian product: for every coordinate of mode k, all
// prefixes over modes 0..k-1 are emitted in order, so mode 0 varies fastest.
inline std::vector<IntTuple> enumerate_nested(const Shape& shape) {
    std::vector<IntTuple> result;
    if (shape.is_leaf()) {
        for (index_t i = 0; i < shape.value(); ++i) {
            result.emplace_back(i);
        }
        return result;
    }

    std::vector<std::vector<IntTuple>> prefixes(1);
    for (const auto& mode : shape.children()) {
        std::vector<IntTuple> mode_coords = enumerate_nested(mode);
        std::vector<std::vector<IntTuple>> extended;
        extended.reserve(prefixes.size() * mode_coords.size());
        for (const auto& mode_coord : mode_coords) {
            for (const auto& prefix : prefixes) {
                std::vector<IntTuple> coord = prefix;
                coord.push_back(mode_coord);
                extended.push_back(std::move(coord));
            }
        }
        prefixes.swap(extended);
    }

    result.reserve(prefixes.size());
    for (auto& prefix : prefixes) {
        result.emplace_back(std::move(prefix));
    }
    return result;
}

inline IntTuple decompose_index(index_t& remaining, const Shape& shape) {
    if (shape.is_leaf()) {
        index_t extent = shape.value();
        index_t coord = remaining % extent;
        remaining /= extent;
        return IntTuple(coord);
    }
    std::vector<IntTuple> children;
    children.reserve(shape.children().size());
    for (const auto& mode : shape.children()) {
        children.push_back(decompose_index(remaining, mode));
    }
    return IntTuple(std::move(children));
}

} // namespace detail

/**
 * @brief Flatten a nested coordinate into a tuple of leaves
 *
 * 3 -> (3), (5,(2,3)) -> (5,2,3)
 */
inline Coord flatten_coordinate(const Coord& coord) {
    std::vector<IntTuple> leaves;
    for (index_t v : flatten(coord)) {
        leaves.emplace_back(v);
    }
    return IntTuple(std::move(leaves));
}

/**
 * @brief Generate every coordinate of a shape in column-major order
 * @param shape Shape tree
 * @param flat If true, each coordinate is a tuple with one entry per leaf;
 *             otherwise it mirrors the nesting of shape
 * @return Coordinates, mode 0 fastest, applied recursively per nesting level
 * @throws RangeError if the index space exceeds config::MAX_ENUMERATION_SIZE
 *
 * (2,3) -> (0,0) (1,0) (0,1) (1,1) (0,2) (1,2)
 */
inline std::vector<Coord> coordinates(const Shape& shape, bool flat = false) {
    index_t total = size(shape);
    if (total > config::MAX_ENUMERATION_SIZE) {
        throw RangeError("Shape " + shape.to_string() + " has " + std::to_string(total) +
                         " coordinates, more than the enumeration limit of " +
                         std::to_string(config::MAX_ENUMERATION_SIZE));
    }

    std::vector<Coord> coords = detail::enumerate_nested(shape);
    if (flat) {
        for (auto& coord : coords) {
            coord = flatten_coordinate(coord);
        }
    }
    return coords;
}

/**
 * @brief Dot product of flat coordinates and flat strides
 * @throws DimensionMismatchError if lengths differ
 */
inline index_t offset(const std::vector<index_t>& coord, const std::vector<index_t>& stride) {
    if (coord.size() != stride.size()) {
        throw DimensionMismatchError("Coordinate and stride dimension mismatch: " +
                                     std::to_string(coord.size()) + " coordinates, " +
                                     std::to_string(stride.size()) + " strides");
    }
    index_t result = 0;
    for (size_t i = 0; i < coord.size(); ++i) {
        result += coord[i] * stride[i];
    }
    return result;
}

/**
 * @brief Memory offset of a coordinate
 * @param coord Nested or flat coordinate
 * @param stride Nested or flat stride
 * @return Sum of coordinate * stride over the flattened leaves
 * @throws DimensionMismatchError if the flattened lengths differ
 *
 * offset((5,(2,3)), (59,(13,1))) == offset((5,2,3), (59,13,1)) == 324
 */
inline index_t offset(const Coord& coord, const Stride& stride) {
    std::vector<index_t> flat_coord = flatten(coord);
    std::vector<index_t> flat_stride = flatten(stride);
    if (flat_coord.size() != flat_stride.size()) {
        throw DimensionMismatchError("Coordinate and stride dimension mismatch: coords " +
                                     coord.to_string() + ", strides " + stride.to_string());
    }
    return offset(flat_coord, flat_stride);
}

/**
 * @brief Coordinate at a given position of the column-major enumeration
 * @param position Linear index into coordinates(shape)
 * @param shape Shape tree
 * @return Nested coordinate, identical to coordinates(shape, false)[position]
 * @throws RangeError if position is outside [0, size(shape)), or for any
 *         position when an extent is zero or negative
 */
inline Coord offset_to_coordinate(index_t position, const Shape& shape) {
    for (index_t extent : flatten(shape)) {
        if (extent <= 0) {
            throw RangeError("Offset " + std::to_string(position) + " is out of range for shape " +
                             shape.to_string() + " (shape has no coordinates)");
        }
    }
    index_t total = size(shape);
    if (position < 0 || position >= total) {
        throw RangeError("Offset " + std::to_string(position) + " is out of range for shape " +
                         shape.to_string() + " (valid range: 0 to " +
                         std::to_string(total - 1) + ")");
    }
    index_t remaining = position;
    return detail::decompose_index(remaining, shape);
}

/**
 * @brief Strides of the compact column-major layout of a shape
 *
 * The first leaf gets stride 1, each later leaf the product of all
 * earlier extents: (2,(3,4)) -> (1,(2,6)).
 * @throws RangeError if a stride overflows index_t
 */
inline Stride compact_col_major(const Shape& shape) {
    std::vector<index_t> extents = flatten(shape);
    std::vector<index_t> strides;
    strides.reserve(extents.size());
    index_t current = 1;
    for (size_t i = 0; i < extents.size(); ++i) {
        strides.push_back(current);
        if (i + 1 < extents.size()) {
            current = detail::checked_multiply(current, extents[i], shape);
        }
    }
    return unflatten(strides, shape);
}

/**
 * @brief Display form of a coordinate with one-element tuples unwrapped
 *
 * 5 -> "5", (0) -> "0", (5,(2,3)) -> "(5,(2,3))", ((0),(1)) -> "(0,1)"
 */
inline std::string format_coordinate(const Coord& coord) {
    if (coord.is_leaf()) {
        return std::to_string(coord.value());
    }
    if (coord.rank() == 1) {
        return format_coordinate(coord[0]);
    }
    std::string result = "(";
    for (dim_t i = 0; i < coord.rank(); ++i) {
        if (i > 0) {
            result += ",";
        }
        result += format_coordinate(coord[i]);
    }
    return result + ")";
}

} // namespace layout_algebra

#endif // LAYOUT_ALGEBRA_LAYOUT_COORDINATE_HPP

/**
 * @file layout.hpp
 * @brief Layout combining a shape tree and an isomorphic stride tree
 */

#ifndef LAYOUT_ALGEBRA_LAYOUT_LAYOUT_HPP
#define LAYOUT_ALGEBRA_LAYOUT_LAYOUT_HPP

#include <ostream>
#include <string>
#include <vector>
#include "int_tuple.hpp"
#include "structure.hpp"
#include "flatten.hpp"
#include "coordinate.hpp"
#include "../core/types.hpp"
#include "../core/error.hpp"

namespace layout_algebra {

/**
 * @class Layout
 * @brief Maps coordinates of a hierarchical index space to linear offsets
 *
 * Written "Shape:Stride", e.g. (4,8):(1,4). Layouts are immutable; every
 * algebra operation returns a new Layout.
 */
class Layout {
public:
    /**
     * @brief Constructor from shape and stride
     * @param shape Shape tree
     * @param stride Stride tree, isomorphic to shape
     * @throws StructureError if shape and stride structures don't match
     */
    Layout(const Shape& shape, const Stride& stride)
        : shape_(shape), stride_(stride) {
        validate_layout(shape_, stride_);
    }

    /**
     * @brief Constructor from shape (compact column-major strides)
     * @param shape Shape tree
     */
    explicit Layout(const Shape& shape)
        : shape_(shape), stride_(compact_col_major(shape)) {}

    /**
     * @brief Get the shape tree
     */
    const Shape& shape() const { return shape_; }

    /**
     * @brief Get the stride tree
     */
    const Stride& stride() const { return stride_; }

    /**
     * @brief Number of top-level modes (1 for a scalar layout)
     */
    dim_t rank() const { return shape_.rank(); }

    /**
     * @brief Nesting depth (0 for a scalar layout)
     */
    dim_t depth() const { return shape_.depth(); }

    /**
     * @brief True for a single extent:stride pair
     */
    bool is_leaf() const { return shape_.is_leaf(); }

    /**
     * @brief Total number of elements
     * @throws RangeError if the extent product overflows index_t
     */
    index_t size() const { return layout_algebra::size(shape_); }

    /**
     * @brief Sub-layout of a top-level mode
     * @param index Mode index
     * @return Layout of shape[index]:stride[index]
     * @throws TypeError for a scalar layout, RangeError for a bad index
     */
    Layout mode(dim_t index) const {
        return Layout(shape_[index], stride_[index]);
    }

    /**
     * @brief Flatten shape and stride into leaf sequences
     */
    FlatLayout flatten() const {
        return FlatLayout{layout_algebra::flatten(shape_), layout_algebra::flatten(stride_)};
    }

    /**
     * @brief All coordinates in column-major order
     * @param flat If true, return flattened coordinates
     */
    std::vector<Coord> coordinates(bool flat = false) const {
        return layout_algebra::coordinates(shape_, flat);
    }

    /**
     * @brief Memory offset of a nested or flattened coordinate
     * @throws DimensionMismatchError if coord has the wrong number of leaves
     */
    index_t offset(const Coord& coord) const {
        return layout_algebra::offset(coord, stride_);
    }

    /**
     * @brief Coordinate at a position of the column-major enumeration
     * @throws RangeError if position is outside [0, size())
     */
    Coord coordinate(index_t position) const {
        return offset_to_coordinate(position, shape_);
    }

    /**
     * @brief Offset of the position-th coordinate, L(i)
     * @throws RangeError if position is outside [0, size())
     */
    index_t operator()(index_t position) const {
        return offset(coordinate(position));
    }

    /**
     * @brief Text form "shape:stride"
     */
    std::string to_string() const {
        return shape_.to_string() + ":" + stride_.to_string();
    }

    bool operator==(const Layout& other) const {
        return shape_ == other.shape_ && stride_ == other.stride_;
    }

    bool operator!=(const Layout& other) const {
        return !(*this == other);
    }

private:
    Shape shape_;
    Stride stride_;
};

inline std::ostream& operator<<(std::ostream& os, const Layout& layout) {
    return os << layout.to_string();
}

/**
 * @brief Create a layout from shape and stride
 */
inline Layout make_layout(const Shape& shape, const Stride& stride) {
    return Layout(shape, stride);
}

/**
 * @brief Create a compact column-major layout from shape
 */
inline Layout make_layout(const Shape& shape) {
    return Layout(shape);
}

/**
 * @brief Text form "shape:stride", the inverse of parse_layout
 */
inline std::string layout_to_string(const Layout& layout) {
    return layout.to_string();
}

} // namespace layout_algebra

#endif // LAYOUT_ALGEBRA_LAYOUT_LAYOUT_HPP

/**
 * @file coalesce.hpp
 * @brief Removal of trailing singleton modes
 */

#ifndef LAYOUT_ALGEBRA_ALGEBRA_COALESCE_HPP
#define LAYOUT_ALGEBRA_ALGEBRA_COALESCE_HPP

#include <vector>
#include "../layout/layout.hpp"
#include "../utils/debug.hpp"

namespace layout_algebra {

/**
 * @brief Simplify a layout by removing trailing top-level modes of extent 1
 * @param shape Shape tree
 * @param stride Stride tree
 * @return 1:0 if every mode was removed, the single remaining mode if one is
 *         left, otherwise the shortened tuple
 * @throws StructureError if shape and stride don't match
 *
 * (3,1):(8,2) -> 3:8
 * (2,2):(24,2) -> (2,2):(24,2)
 *
 * Only top-level leaf modes equal to 1 are removed; nested modes are kept as is.
 */
inline Layout coalesce_layout(const Shape& shape, const Stride& stride) {
    validate_layout(shape, stride);
    if (shape.is_leaf()) {
        return Layout(shape, stride);
    }

    std::vector<IntTuple> shapes = shape.children();
    std::vector<IntTuple> strides = stride.children();
    while (!shapes.empty() && shapes.back().is_leaf() && shapes.back().value() == 1) {
        shapes.pop_back();
        strides.pop_back();
    }

    if (shapes.empty()) {
        return Layout(1, 0);
    }
    if (shapes.size() == 1) {
        return Layout(shapes.front(), strides.front());
    }
    return Layout(IntTuple(std::move(shapes)), IntTuple(std::move(strides)));
}

inline Layout coalesce_layout(const Layout& layout) {
    return coalesce_layout(layout.shape(), layout.stride());
}

} // namespace layout_algebra

#endif // LAYOUT_ALGEBRA_ALGEBRA_COALESCE_HPP

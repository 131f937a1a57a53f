/**
 * @file composition.hpp
 * @brief Functional composition of layouts, A o B
 */

#ifndef LAYOUT_ALGEBRA_ALGEBRA_COMPOSITION_HPP
#define LAYOUT_ALGEBRA_ALGEBRA_COMPOSITION_HPP

#include <vector>
#include "divide.hpp"
#include "modulo.hpp"
#include "coalesce.hpp"
#include "../layout/layout.hpp"
#include "../core/error.hpp"
#include "../utils/debug.hpp"

namespace layout_algebra {

/**
 * @brief Compose two layouts: outer o inner
 * @param outer Layout A
 * @param inner Layout B
 * @return Layout C with C(i) == A(B(i)) for every i < size(B)
 * @throws DivisibilityError if a stride of B does not divide A exactly or is
 *         not positive
 *
 * For a scalar B = s:d, A is divided by d and the quotient's shape is
 * truncated to s elements; the quotient's strides are kept. For a tuple B,
 * A is composed with each top-level mode of B and each result is coalesced.
 *
 * (3,6,2,8):(5,15,90,180) o 16:9 -> (1,2,2,4):(45,45,90,180)
 * (6,2):(8,2) o (4,3):(3,1) -> ((2,2),3):((24,2),8)
 */
inline Layout composition(const Layout& outer, const Layout& inner) {
    if (inner.is_leaf()) {
        Layout quotient = divide_layout(outer, inner.stride().value());
        Layout result(mod_shape(quotient.shape(), inner.shape().value()), quotient.stride());
        LAYOUT_DEBUG("compose ", outer, " o ", inner, " -> ", result);
        return result;
    }

    std::vector<IntTuple> shapes;
    std::vector<IntTuple> strides;
    shapes.reserve(inner.rank());
    strides.reserve(inner.rank());
    for (dim_t i = 0; i < inner.rank(); ++i) {
        Layout composed = coalesce_layout(composition(outer, inner.mode(i)));
        shapes.push_back(composed.shape());
        strides.push_back(composed.stride());
    }

    Layout result(IntTuple(std::move(shapes)), IntTuple(std::move(strides)));
    LAYOUT_DEBUG("compose ", outer, " o ", inner, " -> ", result);
    return result;
}

/**
 * @brief Compose each top-level mode of a layout with its own layout
 * @param layout Layout with N top-level modes (a scalar layout has one)
 * @param mode_layouts N layouts, applied to the modes in order
 * @return Tuple layout of rank N whose mode i is mode(i) o mode_layouts[i]
 * @throws ArityError if mode_layouts.size() != N
 *
 * (12,(4,8)):(59,(13,1)) by <3:4, 8:2> -> (3,(2,4)):(236,(26,1))
 */
inline Layout composition_by_mode(const Layout& layout, const std::vector<Layout>& mode_layouts) {
    dim_t modes = layout.rank();
    if (static_cast<size_t>(modes) != mode_layouts.size()) {
        LAYOUT_INFO("composition_by_mode: ", mode_layouts.size(), " layouts for ", layout);
        throw ArityError(modes, static_cast<dim_t>(mode_layouts.size()));
    }

    std::vector<IntTuple> shapes;
    std::vector<IntTuple> strides;
    for (dim_t i = 0; i < modes; ++i) {
        Layout mode = layout.is_leaf() ? layout : layout.mode(i);
        Layout composed = composition(mode, mode_layouts[i]);
        shapes.push_back(composed.shape());
        strides.push_back(composed.stride());
    }
    return Layout(IntTuple(std::move(shapes)), IntTuple(std::move(strides)));
}

} // namespace layout_algebra

#endif // LAYOUT_ALGEBRA_ALGEBRA_COMPOSITION_HPP

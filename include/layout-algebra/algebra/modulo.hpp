/**
 * @file modulo.hpp
 * @brief Shape truncation by a modulus
 */

#ifndef LAYOUT_ALGEBRA_ALGEBRA_MODULO_HPP
#define LAYOUT_ALGEBRA_ALGEBRA_MODULO_HPP

#include <vector>
#include "../layout/int_tuple.hpp"
#include "../layout/flatten.hpp"
#include "../utils/debug.hpp"

namespace layout_algebra {

/**
 * @brief Keep the first modulus elements of a shape, mode by mode from the left
 * @param shape Shape tree
 * @param modulus Number of elements to keep
 * @return Shape nested like the input
 *
 * 6 % 2 -> 2
 * (6,2) % 6 -> (6,1)
 * (3,6,2,8) % 9 -> (3,3,1,1)
 */
inline Shape mod_shape(const Shape& shape, index_t modulus) {
    std::vector<index_t> extents = flatten(shape);

    index_t remaining = modulus;
    for (auto& extent : extents) {
        if (remaining >= extent) {
            // Keep the whole mode; a degenerate extent exhausts the budget
            remaining = extent > 0 ? remaining / extent : 0;
        } else if (remaining > 0) {
            extent = remaining;
            remaining = 1;
        } else {
            extent = 1;
        }
    }

    Shape result = unflatten(extents, shape);
    LAYOUT_DEBUG("mod ", shape, " by ", modulus, " -> ", result);
    return result;
}

} // namespace layout_algebra

#endif // LAYOUT_ALGEBRA_ALGEBRA_MODULO_HPP

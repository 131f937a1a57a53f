/**
 * @file divide.hpp
 * @brief Layout division by an integer divisor
 */

#ifndef LAYOUT_ALGEBRA_ALGEBRA_DIVIDE_HPP
#define LAYOUT_ALGEBRA_ALGEBRA_DIVIDE_HPP

#include <string>
#include <vector>
#include "../layout/layout.hpp"
#include "../layout/flatten.hpp"
#include "../core/error.hpp"
#include "../utils/debug.hpp"

namespace layout_algebra {
namespace algebra {

/**
 * @brief Divide flattened modes by a divisor, in place
 * @param flat Flattened layout, modified left to right
 * @param divisor Amount to divide out of the leading modes
 * @throws DivisibilityError if the division is not exact
 *
 * A mode that can absorb the remaining divisor is divided and its stride
 * scaled, ending the walk. A mode smaller than the remaining divisor is
 * consumed completely: it becomes a singleton with the scaled stride and the
 * divisor shrinks by its extent.
 */
inline void divide_flat(FlatLayout& flat, index_t divisor) {
    if (divisor <= 0) {
        throw DivisibilityError("Stride divisibility condition violated: divisor " +
                                std::to_string(divisor) + " must be positive");
    }

    index_t remaining = divisor;
    for (size_t i = 0; i < flat.size() && remaining != 1; ++i) {
        index_t extent = flat.shape[i];
        index_t stride = flat.stride[i];

        if (remaining <= extent) {
            if (extent % remaining != 0) {
                throw DivisibilityError("Stride divisibility condition violated: mode " +
                                        std::to_string(extent) + " not divisible by " +
                                        std::to_string(remaining));
            }
            flat.shape[i] = extent / remaining;
            flat.stride[i] = stride * remaining;
            return;
        }

        if (extent == 0 || remaining % extent != 0) {
            throw DivisibilityError("Stride divisibility condition violated: cannot divide " +
                                    std::to_string(remaining) + " by mode of size " +
                                    std::to_string(extent));
        }
        flat.shape[i] = 1;
        flat.stride[i] = stride * remaining;
        remaining /= extent;
    }

    if (remaining != 1) {
        throw DivisibilityError("Stride divisibility condition violated: " +
                                std::to_string(remaining) +
                                " remaining after dividing all shapes");
    }
}

} // namespace algebra

/**
 * @brief Divide a layout by a divisor
 * @param shape Shape tree
 * @param stride Stride tree
 * @param divisor Number of leading elements split off
 * @return Outer layout of the tiling, nested like the input
 * @throws StructureError if shape and stride don't match
 * @throws DivisibilityError if the divisor does not split the modes exactly,
 *         or if it is zero or negative
 *
 * Only positive divisors are accepted. Composing with a layout whose stride
 * is zero or negative therefore fails here, although such strides are valid
 * in a layout.
 *
 * (6,2):(1,6) / 2 -> (3,2):(2,6)
 * (3,6,2,8):(5,15,90,180) / 72 -> (1,1,1,4):(360,360,360,360)
 */
inline Layout divide_layout(const Shape& shape, const Stride& stride, index_t divisor) {
    FlatLayout flat = flatten_layout(shape, stride);
    algebra::divide_flat(flat, divisor);

    Layout result(unflatten(flat.shape, shape), unflatten(flat.stride, stride));
    LAYOUT_DEBUG("divide ", shape, ":", stride, " by ", divisor, " -> ", result);
    return result;
}

inline Layout divide_layout(const Layout& layout, index_t divisor) {
    return divide_layout(layout.shape(), layout.stride(), divisor);
}

} // namespace layout_algebra

#endif // LAYOUT_ALGEBRA_ALGEBRA_DIVIDE_HPP

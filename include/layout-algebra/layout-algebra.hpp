/**
 * @file layout-algebra.hpp
 * @brief Main header for the layout-algebra library
 */

#ifndef LAYOUT_ALGEBRA_HPP
#define LAYOUT_ALGEBRA_HPP

#include "core/types.hpp"
#include "core/config.hpp"
#include "core/error.hpp"
#include "utils/debug.hpp"
#include "layout/int_tuple.hpp"
#include "layout/structure.hpp"
#include "layout/flatten.hpp"
#include "layout/coordinate.hpp"
#include "layout/layout.hpp"
#include "algebra/divide.hpp"
#include "algebra/modulo.hpp"
#include "algebra/coalesce.hpp"
#include "algebra/composition.hpp"
#include "parser/layout_parser.hpp"
#include "utils/offset_grid.hpp"

/**
 * @namespace layout_algebra
 * @brief CuTe-style Shape:Stride layout algebra
 */
namespace layout_algebra {

/**
 * @brief Library version as "major.minor.patch"
 */
inline std::string version() {
    return std::to_string(config::VERSION_MAJOR) + "." +
           std::to_string(config::VERSION_MINOR) + "." +
           std::to_string(config::VERSION_PATCH);
}

} // namespace layout_algebra

#endif // LAYOUT_ALGEBRA_HPP

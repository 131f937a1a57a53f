/**
 * @file config.hpp
 * @brief Configuration constants and compile-time options for layout-algebra
 */

#ifndef LAYOUT_ALGEBRA_CORE_CONFIG_HPP
#define LAYOUT_ALGEBRA_CORE_CONFIG_HPP

#include "types.hpp"

#ifndef LAYOUT_ALGEBRA_MAX_PARSE_DEPTH
#define LAYOUT_ALGEBRA_MAX_PARSE_DEPTH 64
#endif

#ifndef LAYOUT_ALGEBRA_MAX_ENUMERATION_SIZE
#define LAYOUT_ALGEBRA_MAX_ENUMERATION_SIZE (index_t(1) << 26)
#endif

namespace layout_algebra {
namespace config {

// Version information
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

// Deepest parenthesis nesting accepted by the text parser
constexpr dim_t MAX_PARSE_DEPTH = LAYOUT_ALGEBRA_MAX_PARSE_DEPTH;

// Largest index space coordinates() will materialize
constexpr index_t MAX_ENUMERATION_SIZE = LAYOUT_ALGEBRA_MAX_ENUMERATION_SIZE;

// Debug configuration
#ifdef LAYOUT_ALGEBRA_DEBUG
constexpr bool DEBUG_MODE = true;
#else
constexpr bool DEBUG_MODE = false;
#endif

// Error handling configuration
constexpr bool ENABLE_ASSERTIONS = DEBUG_MODE;

} // namespace config
} // namespace layout_algebra

#endif // LAYOUT_ALGEBRA_CORE_CONFIG_HPP

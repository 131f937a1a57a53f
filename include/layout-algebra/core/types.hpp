/**
 * @file types.hpp
 * @brief Core type definitions for the layout-algebra library
 */

#ifndef LAYOUT_ALGEBRA_CORE_TYPES_HPP
#define LAYOUT_ALGEBRA_CORE_TYPES_HPP

#include <cstddef>
#include <cstdint>

namespace layout_algebra {

// Basic integer types
using int32_t = std::int32_t;
using int64_t = std::int64_t;
using uint8_t = std::uint8_t;

// Index and dimension types
using index_t = int64_t;
using dim_t = int32_t;
using size_t = std::size_t;

/**
 * @enum NodeKind
 * @brief Discriminator of an IntTuple node
 */
enum class NodeKind : uint8_t {
    LEAF = 0,
    TUPLE = 1
};

/**
 * @brief Get the display name of a node kind
 * @param kind Node kind
 * @return "a scalar" or "a tuple"
 */
inline const char* node_kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::LEAF: return "a scalar";
        case NodeKind::TUPLE: return "a tuple";
        default: return "unknown";
    }
}

} // namespace layout_algebra

#endif // LAYOUT_ALGEBRA_CORE_TYPES_HPP

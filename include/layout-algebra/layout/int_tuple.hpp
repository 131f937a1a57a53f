/**
 * @file int_tuple.hpp
 * @brief Recursive integer tree used for shapes, strides and coordinates
 */

#ifndef LAYOUT_ALGEBRA_LAYOUT_INT_TUPLE_HPP
#define LAYOUT_ALGEBRA_LAYOUT_INT_TUPLE_HPP

#include <algorithm>
#include <initializer_list>
#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include "../core/types.hpp"
#include "../core/error.hpp"

namespace layout_algebra {

/**
 * @class IntTuple
 * @brief Either a single integer (leaf) or an ordered tuple of IntTuples
 *
 * Tuples always hold at least one child. Construction rules:
 * @code
 * IntTuple a = 12;             // leaf
 * IntTuple b = {12, {4, 8}};   // (12,(4,8))
 * IntTuple c{5};               // one-element tuple (5), not a leaf
 * @endcode
 */
class IntTuple {
public:
    /**
     * @brief Default constructor - creates the leaf 0
     */
    IntTuple() : kind_(NodeKind::LEAF), value_(0) {}

    /**
     * @brief Constructor from integer (leaf)
     * @param value Leaf value
     */
    IntTuple(index_t value) : kind_(NodeKind::LEAF), value_(value) {}

    /**
     * @brief Constructor from initializer list (tuple)
     * @param children Tuple elements
     */
    IntTuple(std::initializer_list<IntTuple> children)
        : kind_(NodeKind::TUPLE), value_(0), children_(children) {
        check_not_empty();
    }

    /**
     * @brief Constructor from vector (tuple)
     * @param children Tuple elements
     */
    explicit IntTuple(std::vector<IntTuple> children)
        : kind_(NodeKind::TUPLE), value_(0), children_(std::move(children)) {
        check_not_empty();
    }

    NodeKind kind() const { return kind_; }
    bool is_leaf() const { return kind_ == NodeKind::LEAF; }
    bool is_tuple() const { return kind_ == NodeKind::TUPLE; }

    /**
     * @brief Get the leaf value
     * @throws TypeError if this node is a tuple
     */
    index_t value() const {
        if (!is_leaf()) {
            throw TypeError("IntTuple::value() called on tuple " + to_string());
        }
        return value_;
    }

    /**
     * @brief Get the tuple elements
     * @throws TypeError if this node is a leaf
     */
    const std::vector<IntTuple>& children() const {
        if (!is_tuple()) {
            throw TypeError("IntTuple::children() called on scalar " + to_string());
        }
        return children_;
    }

    /**
     * @brief Number of top-level modes (1 for a leaf)
     */
    dim_t rank() const {
        return is_leaf() ? 1 : static_cast<dim_t>(children_.size());
    }

    /**
     * @brief Nesting depth (0 for a leaf)
     */
    dim_t depth() const {
        if (is_leaf()) {
            return 0;
        }
        dim_t deepest = 0;
        for (const auto& child : children_) {
            deepest = std::max(deepest, child.depth());
        }
        return deepest + 1;
    }

    /**
     * @brief Number of leaves in the tree
     */
    size_t leaf_count() const {
        if (is_leaf()) {
            return 1;
        }
        size_t count = 0;
        for (const auto& child : children_) {
            count += child.leaf_count();
        }
        return count;
    }

    /**
     * @brief Get tuple element at index
     * @param index Element index
     * @return Element
     * @throws TypeError if this node is a leaf, RangeError if index is out of range
     */
    const IntTuple& operator[](dim_t index) const {
        const auto& elems = children();
        if (index < 0 || static_cast<size_t>(index) >= elems.size()) {
            throw RangeError("IntTuple index " + std::to_string(index) +
                             " out of range for " + to_string());
        }
        return elems[index];
    }

    /**
     * @brief Text form without spaces, e.g. "(12,(4,8))"
     */
    std::string to_string() const {
        if (is_leaf()) {
            return std::to_string(value_);
        }
        std::string result = "(";
        for (size_t i = 0; i < children_.size(); ++i) {
            if (i > 0) {
                result += ",";
            }
            result += children_[i].to_string();
        }
        result += ")";
        return result;
    }

    bool operator==(const IntTuple& other) const {
        if (kind_ != other.kind_) return false;
        if (is_leaf()) return value_ == other.value_;
        return children_ == other.children_;
    }

    bool operator!=(const IntTuple& other) const {
        return !(*this == other);
    }

private:
    void check_not_empty() const {
        if (children_.empty()) {
            throw StructureError(StructureErrorKind::EMPTY_TUPLE, "",
                                 "Tuple must contain at least one element");
        }
    }

    NodeKind kind_;
    index_t value_;
    std::vector<IntTuple> children_;
};

using Shape = IntTuple;
using Stride = IntTuple;
using Coord = IntTuple;

inline std::ostream& operator<<(std::ostream& os, const IntTuple& tuple) {
    return os << tuple.to_string();
}

inline std::string to_string(const IntTuple& tuple) {
    return tuple.to_string();
}

/**
 * @brief Create a tuple from elements
 * @param elems Integers or IntTuples
 * @return Tuple IntTuple
 */
template<typename... Args>
IntTuple make_tuple(Args... elems) {
    return IntTuple(std::vector<IntTuple>{IntTuple(elems)...});
}

/**
 * @brief Create a shape from dimensions
 */
template<typename... Args>
Shape make_shape(Args... dims) {
    return make_tuple(dims...);
}

/**
 * @brief Create a stride from values
 */
template<typename... Args>
Stride make_stride(Args... strides) {
    return make_tuple(strides...);
}

} // namespace layout_algebra

#endif // LAYOUT_ALGEBRA_LAYOUT_INT_TUPLE_HPP

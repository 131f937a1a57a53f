/**
 * @file layout_parser.hpp
 * @brief Recursive-descent parser for "Shape:Stride" layout strings
 */

#ifndef LAYOUT_ALGEBRA_PARSER_LAYOUT_PARSER_HPP
#define LAYOUT_ALGEBRA_PARSER_LAYOUT_PARSER_HPP

#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>
#include <string>
#include <vector>
#include "../layout/int_tuple.hpp"
#include "../layout/layout.hpp"
#include "../core/config.hpp"
#include "../core/error.hpp"
#include "../utils/debug.hpp"

namespace layout_algebra {

/**
 * @struct ParsedLayout
 * @brief Shape and stride trees read from text, structurally checked
 */
struct ParsedLayout {
    Shape shape;
    Stride stride;

    bool operator==(const ParsedLayout& other) const {
        return shape == other.shape && stride == other.stride;
    }
    bool operator!=(const ParsedLayout& other) const { return !(*this == other); }
};

namespace detail {

/**
 * @class OperandParser
 * @brief Parses one side of a layout string (shape or stride)
 *
 * Grammar, whitespace already removed:
 *   value   := integer | "(" value ("," value)* ")"
 *   integer := ["-"] digit+
 */
class OperandParser {
public:
    OperandParser(const std::string& text, const std::string& name)
        : text_(text), name_(name), pos_(0) {}

    IntTuple parse() {
        IntTuple value = parse_value(0);
        if (pos_ != text_.size()) {
            throw ParseError(ParseErrorKind::UNEXPECTED_TOKEN,
                             "Unexpected '" + std::string(1, text_[pos_]) + "' at position " +
                             std::to_string(pos_) + " in " + name_ + " \"" + text_ + "\"");
        }
        return value;
    }

private:
    bool at_end() const { return pos_ >= text_.size(); }
    char peek() const { return text_[pos_]; }

    IntTuple parse_value(dim_t depth) {
        if (at_end()) {
            throw ParseError(ParseErrorKind::UNEXPECTED_TOKEN,
                             "Unexpected end of " + name_ + " \"" + text_ + "\"");
        }
        char c = peek();
        if (c == '(') {
            return parse_tuple(depth + 1);
        }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            return parse_integer();
        }
        // ',' or ')' where an element should start
        throw ParseError(ParseErrorKind::EMPTY_ELEMENT,
                         "Empty element in tuple (check for double commas or trailing commas) in " +
                         name_ + " \"" + text_ + "\"");
    }

    IntTuple parse_tuple(dim_t depth) {
        if (depth > config::MAX_PARSE_DEPTH) {
            throw ParseError(ParseErrorKind::DEPTH_EXCEEDED,
                             "Nesting deeper than " + std::to_string(config::MAX_PARSE_DEPTH) +
                             " levels in " + name_);
        }
        ++pos_;  // '('
        if (!at_end() && peek() == ')') {
            throw ParseError(ParseErrorKind::EMPTY_PARENTHESES,
                             "Empty parentheses \"()\" are not allowed in " + name_);
        }

        std::vector<IntTuple> children;
        while (true) {
            children.push_back(parse_value(depth));
            if (at_end()) {
                throw ParseError(ParseErrorKind::UNBALANCED_PARENTHESES,
                                 "Unbalanced parentheses in " + name_ + " \"" + text_ + "\"");
            }
            char c = peek();
            ++pos_;
            if (c == ')') {
                break;
            }
            if (c != ',') {
                throw ParseError(ParseErrorKind::UNEXPECTED_TOKEN,
                                 "Expected ',' or ')' at position " + std::to_string(pos_ - 1) +
                                 " in " + name_ + " \"" + text_ + "\", found '" +
                                 std::string(1, c) + "'");
            }
        }
        return IntTuple(std::move(children));
    }

    IntTuple parse_integer() {
        size_t start = pos_;
        bool negative = peek() == '-';
        if (negative) {
            ++pos_;
        }

        // Accumulate as a negative number so the full index_t range is accepted
        constexpr index_t min_value = std::numeric_limits<index_t>::min();
        index_t value = 0;
        size_t digits = 0;
        bool overflow = false;
        while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
            index_t d = peek() - '0';
            if (value < (min_value + d) / 10) {
                overflow = true;
            } else {
                value = value * 10 - d;
            }
            ++digits;
            ++pos_;
        }

        if (digits == 0 || (!at_end() && peek() == '-')) {
            size_t end = text_.find_first_of(",)", pos_);
            std::string token = text_.substr(start, end == std::string::npos ? end : end - start);
            throw ParseError(ParseErrorKind::INVALID_INTEGER,
                             "Cannot parse \"" + token + "\" as integer in " + name_);
        }
        if (overflow || (!negative && value == min_value)) {
            throw ParseError(ParseErrorKind::INVALID_INTEGER,
                             "Integer \"" + text_.substr(start, pos_ - start) +
                             "\" out of range in " + name_);
        }
        return IntTuple(negative ? value : -value);
    }

    std::string text_;
    std::string name_;
    size_t pos_;
};

inline void check_operand_characters(const std::string& text, const std::string& name) {
    int depth = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c)) &&
            c != '(' && c != ')' && c != ',' && c != '-') {
            throw ParseError(ParseErrorKind::INVALID_CHARACTER,
                             "Invalid character '" + std::string(1, c) + "' found in " + name);
        }
        if (c == '(') {
            ++depth;
        } else if (c == ')' && --depth < 0) {
            break;
        }
    }
    if (depth != 0) {
        throw ParseError(ParseErrorKind::UNBALANCED_PARENTHESES,
                         "Unbalanced parentheses in " + name + " \"" + text + "\"");
    }
}

inline void check_structure(const IntTuple& shape, const IntTuple& stride, const std::string& path) {
    const std::string shape_name = "shape" + path;
    const std::string stride_name = "stride" + path;
    if (shape.is_tuple() && stride.is_tuple()) {
        if (shape.rank() != stride.rank()) {
            throw StructureError(StructureErrorKind::ARITY_MISMATCH, path,
                                 "Structure mismatch: " + shape_name + " has " +
                                 std::to_string(shape.rank()) + " elements but " + stride_name +
                                 " has " + std::to_string(stride.rank()) + " elements");
        }
        for (dim_t i = 0; i < shape.rank(); ++i) {
            check_structure(shape[i], stride[i], path + "[" + std::to_string(i) + "]");
        }
    } else if (shape.is_tuple() || stride.is_tuple()) {
        throw StructureError(StructureErrorKind::TYPE_MISMATCH, path,
                             "Structure mismatch: " + shape_name + " is " +
                             node_kind_name(shape.kind()) + " but " + stride_name + " is " +
                             node_kind_name(stride.kind()));
    }
}

} // namespace detail

/**
 * @brief Parse a layout string in Shape:Stride format
 * @param text e.g. "(12,(4,8)):(59,(13,1))"; whitespace is ignored
 * @return Shape and stride trees
 * @throws ParseError on malformed text
 * @throws StructureError if shape and stride nest differently; the message
 *         names the path, e.g. "shape[1] has 2 elements but stride[1] has 3 elements"
 */
inline ParsedLayout parse_layout_string(const std::string& text) {
    std::string cleaned;
    cleaned.reserve(text.size());
    std::copy_if(text.begin(), text.end(), std::back_inserter(cleaned),
                 [](char c) { return !std::isspace(static_cast<unsigned char>(c)); });

    if (cleaned.empty()) {
        throw ParseError(ParseErrorKind::EMPTY_INPUT, "Input string cannot be empty");
    }

    auto colons = std::count(cleaned.begin(), cleaned.end(), ':');
    if (colons == 0) {
        throw ParseError(ParseErrorKind::MISSING_SEPARATOR,
                         "Missing colon separator. Expected format \"Shape:Stride\"");
    }
    if (colons > 1) {
        throw ParseError(ParseErrorKind::MULTIPLE_SEPARATORS,
                         "Expected exactly one colon separator, found " + std::to_string(colons));
    }

    size_t colon = cleaned.find(':');
    std::string shape_text = cleaned.substr(0, colon);
    std::string stride_text = cleaned.substr(colon + 1);
    if (shape_text.empty() || stride_text.empty()) {
        throw ParseError(ParseErrorKind::MISSING_OPERAND, "Both shape and stride must be specified");
    }

    detail::check_operand_characters(shape_text, "shape");
    detail::check_operand_characters(stride_text, "stride");

    ParsedLayout parsed{detail::OperandParser(shape_text, "shape").parse(),
                        detail::OperandParser(stride_text, "stride").parse()};
    detail::check_structure(parsed.shape, parsed.stride, "");

    LAYOUT_DEBUG("parsed \"", text, "\" -> ", parsed.shape, ":", parsed.stride);
    return parsed;
}

/**
 * @brief Parse a layout string into a Layout
 */
inline Layout parse_layout(const std::string& text) {
    ParsedLayout parsed = parse_layout_string(text);
    return Layout(parsed.shape, parsed.stride);
}

} // namespace layout_algebra

#endif // LAYOUT_ALGEBRA_PARSER_LAYOUT_PARSER_HPP

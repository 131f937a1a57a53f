/**
 * @file test_parser.cpp
 * @brief Unit tests for the Shape:Stride text parser
 */

#include <gtest/gtest.h>
#include <limits>
#include <string>
#include <vector>
#include "layout-algebra/parser/layout_parser.hpp"

using namespace layout_algebra;

class ParserTest : public ::testing::Test {
protected:
    // Parse text and return the kind of the ParseError it raises
    static ParseErrorKind error_kind(const std::string& text) {
        try {
            parse_layout_string(text);
        } catch (const ParseError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "\"" << text << "\" parsed without error";
        return ParseErrorKind::EMPTY_INPUT;
    }
};

TEST_F(ParserTest, ScalarLayout) {
    ParsedLayout parsed = parse_layout_string("8:1");
    EXPECT_EQ(parsed.shape, IntTuple(8));
    EXPECT_EQ(parsed.stride, IntTuple(1));
}

TEST_F(ParserTest, FlatLayout) {
    ParsedLayout parsed = parse_layout_string("(4,8):(1,4)");
    EXPECT_EQ(parsed.shape, (IntTuple{4, 8}));
    EXPECT_EQ(parsed.stride, (IntTuple{1, 4}));
}

TEST_F(ParserTest, NestedLayout) {
    ParsedLayout parsed = parse_layout_string("(12,(4,8)):(59,(13,1))");
    EXPECT_EQ(parsed, (ParsedLayout{IntTuple{12, {4, 8}}, IntTuple{59, {13, 1}}}));
}

TEST_F(ParserTest, WhitespaceIgnored) {
    EXPECT_EQ(parse_layout_string(" ( 12 , ( 4 , 8 ) ) : ( 59 , ( 13 , 1 ) ) "),
              parse_layout_string("(12,(4,8)):(59,(13,1))"));
    EXPECT_EQ(parse_layout_string("\t(4,8)\n:\n(1,4)"), parse_layout_string("(4,8):(1,4)"));
}

TEST_F(ParserTest, NegativeAndZeroValues) {
    ParsedLayout parsed = parse_layout_string("(4,8):(0,-1)");
    EXPECT_EQ(parsed.stride, (IntTuple{0, -1}));
    EXPECT_EQ(parse_layout_string("-3:-7").shape, IntTuple(-3));
}

TEST_F(ParserTest, SingleElementTuple) {
    ParsedLayout parsed = parse_layout_string("(5):(1)");
    EXPECT_TRUE(parsed.shape.is_tuple());
    EXPECT_EQ(parsed.shape, IntTuple{5});
}

TEST_F(ParserTest, ParseLayout) {
    Layout layout = parse_layout("((2,2),3):((24,2),8)");
    EXPECT_EQ(layout, Layout(IntTuple{{2, 2}, 3}, IntTuple{{24, 2}, 8}));
}

TEST_F(ParserTest, RoundTrip) {
    std::vector<std::string> texts = {
        "8:1",
        "(4,8):(1,4)",
        "(12,(4,8)):(59,(13,1))",
        "((2,2),3):((24,2),8)",
        "(5):(1)",
        "(3,(2,(2,2)),2):(0,(-1,(4,8)),16)",
    };
    for (const auto& text : texts) {
        EXPECT_EQ(layout_to_string(parse_layout(text)), text);
    }
}

TEST_F(ParserTest, SeparatorErrors) {
    EXPECT_EQ(error_kind(""), ParseErrorKind::EMPTY_INPUT);
    EXPECT_EQ(error_kind("   "), ParseErrorKind::EMPTY_INPUT);
    EXPECT_EQ(error_kind("(4,8)"), ParseErrorKind::MISSING_SEPARATOR);
    EXPECT_EQ(error_kind("4:8:1"), ParseErrorKind::MULTIPLE_SEPARATORS);
    EXPECT_EQ(error_kind(":1"), ParseErrorKind::MISSING_OPERAND);
    EXPECT_EQ(error_kind("(4,8):"), ParseErrorKind::MISSING_OPERAND);
}

TEST_F(ParserTest, CharacterErrors) {
    EXPECT_EQ(error_kind("(4,x):(1,4)"), ParseErrorKind::INVALID_CHARACTER);
    EXPECT_EQ(error_kind("[4,8]:[1,4]"), ParseErrorKind::INVALID_CHARACTER);
    EXPECT_EQ(error_kind("4.5:1"), ParseErrorKind::INVALID_CHARACTER);
}

TEST_F(ParserTest, ParenthesisErrors) {
    EXPECT_EQ(error_kind("(4,8:(1,4)"), ParseErrorKind::UNBALANCED_PARENTHESES);
    EXPECT_EQ(error_kind("4,8):(1,4)"), ParseErrorKind::UNBALANCED_PARENTHESES);
    EXPECT_EQ(error_kind(")4(:1"), ParseErrorKind::UNBALANCED_PARENTHESES);
    EXPECT_EQ(error_kind("():1"), ParseErrorKind::EMPTY_PARENTHESES);
    EXPECT_EQ(error_kind("(4,()):(1,2)"), ParseErrorKind::EMPTY_PARENTHESES);
}

TEST_F(ParserTest, ElementErrors) {
    EXPECT_EQ(error_kind("(4,,8):(1,4)"), ParseErrorKind::EMPTY_ELEMENT);
    EXPECT_EQ(error_kind("(4,8,):(1,4,2)"), ParseErrorKind::EMPTY_ELEMENT);
    EXPECT_EQ(error_kind("(,8):(1,4)"), ParseErrorKind::EMPTY_ELEMENT);
    EXPECT_EQ(error_kind("4,8:1"), ParseErrorKind::UNEXPECTED_TOKEN);
    EXPECT_EQ(error_kind("(4)(8):1"), ParseErrorKind::UNEXPECTED_TOKEN);
    EXPECT_EQ(error_kind("(4(8)):1"), ParseErrorKind::UNEXPECTED_TOKEN);
}

TEST_F(ParserTest, IntegerErrors) {
    EXPECT_EQ(error_kind("--4:1"), ParseErrorKind::INVALID_INTEGER);
    EXPECT_EQ(error_kind("4-2:1"), ParseErrorKind::INVALID_INTEGER);
    EXPECT_EQ(error_kind("(-,2):(1,2)"), ParseErrorKind::INVALID_INTEGER);
    EXPECT_EQ(error_kind("99999999999999999999:1"), ParseErrorKind::INVALID_INTEGER);
    EXPECT_EQ(error_kind("9223372036854775808:1"), ParseErrorKind::INVALID_INTEGER);
}

TEST_F(ParserTest, IntegerLimits) {
    EXPECT_EQ(parse_layout_string("9223372036854775807:1").shape.value(),
              std::numeric_limits<index_t>::max());
    EXPECT_EQ(parse_layout_string("1:-9223372036854775808").stride.value(),
              std::numeric_limits<index_t>::min());
}

TEST_F(ParserTest, NestingDepthLimit) {
    std::string deep_ok = std::string(config::MAX_PARSE_DEPTH, '(') + "1" +
                          std::string(config::MAX_PARSE_DEPTH, ')');
    EXPECT_NO_THROW(parse_layout_string(deep_ok + ":" + deep_ok));

    std::string too_deep = std::string(config::MAX_PARSE_DEPTH + 1, '(') + "1" +
                           std::string(config::MAX_PARSE_DEPTH + 1, ')');
    EXPECT_EQ(error_kind(too_deep + ":1"), ParseErrorKind::DEPTH_EXCEEDED);
}

TEST_F(ParserTest, ErrorMessageHasFormatPrefix) {
    try {
        parse_layout_string("(4,8)");
        FAIL() << "missing separator accepted";
    } catch (const ParseError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("Format error: ", 0), 0u);
    }
}

TEST_F(ParserTest, StructureMismatch) {
    EXPECT_THROW(parse_layout_string("(4,8):1"), StructureError);

    try {
        parse_layout_string("(4,8):1");
        FAIL() << "tuple shape with scalar stride accepted";
    } catch (const StructureError& e) {
        EXPECT_EQ(e.kind(), StructureErrorKind::TYPE_MISMATCH);
        EXPECT_NE(std::string(e.what()).find("shape is a tuple but stride is a scalar"),
                  std::string::npos);
    }
}

TEST_F(ParserTest, NestedStructureMismatchNamesPath) {
    try {
        parse_layout_string("(12,(4,8)):(59,(13,1,2))");
        FAIL() << "nested arity mismatch accepted";
    } catch (const StructureError& e) {
        EXPECT_EQ(e.kind(), StructureErrorKind::ARITY_MISMATCH);
        EXPECT_EQ(e.path(), "[1]");
        EXPECT_NE(std::string(e.what()).find("shape[1] has 2 elements but stride[1] has 3 elements"),
                  std::string::npos);
    }
}

TEST_F(ParserTest, StructureErrorIsNotParseError) {
    try {
        parse_layout_string("4:(1,2)");
        FAIL() << "scalar shape with tuple stride accepted";
    } catch (const ParseError&) {
        FAIL() << "structure mismatch reported as a format error";
    } catch (const StructureError& e) {
        EXPECT_EQ(e.path(), "");
    }
}

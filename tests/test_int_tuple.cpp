/**
 * @file test_int_tuple.cpp
 * @brief Unit tests for IntTuple
 */

#include <gtest/gtest.h>
#include <sstream>
#include <vector>
#include "layout-algebra/layout/int_tuple.hpp"

using namespace layout_algebra;

class IntTupleTest : public ::testing::Test {
protected:
    void SetUp() override {
        scalar_ = IntTuple(12);
        flat_ = IntTuple{4, 8};
        nested_ = IntTuple{12, {4, 8}};
    }

    IntTuple scalar_;
    IntTuple flat_;
    IntTuple nested_;
};

TEST_F(IntTupleTest, DefaultConstructor) {
    IntTuple t;
    EXPECT_TRUE(t.is_leaf());
    EXPECT_EQ(t.value(), 0);
}

TEST_F(IntTupleTest, LeafConstructor) {
    EXPECT_TRUE(scalar_.is_leaf());
    EXPECT_FALSE(scalar_.is_tuple());
    EXPECT_EQ(scalar_.kind(), NodeKind::LEAF);
    EXPECT_EQ(scalar_.value(), 12);
    EXPECT_EQ(scalar_.rank(), 1);
    EXPECT_EQ(scalar_.depth(), 0);
    EXPECT_EQ(scalar_.leaf_count(), 1u);
}

TEST_F(IntTupleTest, NegativeAndZeroLeaves) {
    IntTuple negative(-3);
    IntTuple zero(0);
    EXPECT_EQ(negative.value(), -3);
    EXPECT_EQ(zero.value(), 0);
}

TEST_F(IntTupleTest, InitializerListConstructor) {
    EXPECT_TRUE(flat_.is_tuple());
    EXPECT_EQ(flat_.kind(), NodeKind::TUPLE);
    EXPECT_EQ(flat_.rank(), 2);
    EXPECT_EQ(flat_.depth(), 1);
    EXPECT_EQ(flat_[0].value(), 4);
    EXPECT_EQ(flat_[1].value(), 8);
}

TEST_F(IntTupleTest, NestedConstructor) {
    EXPECT_EQ(nested_.rank(), 2);
    EXPECT_EQ(nested_.depth(), 2);
    EXPECT_EQ(nested_.leaf_count(), 3u);
    EXPECT_TRUE(nested_[0].is_leaf());
    EXPECT_TRUE(nested_[1].is_tuple());
    EXPECT_EQ(nested_[1][1].value(), 8);
}

TEST_F(IntTupleTest, VectorConstructor) {
    std::vector<IntTuple> children = {IntTuple(3), IntTuple{1, 2}};
    IntTuple t(children);
    EXPECT_EQ(t.rank(), 2);
    EXPECT_EQ(t, (IntTuple{3, {1, 2}}));
}

TEST_F(IntTupleTest, SingleElementTupleIsNotALeaf) {
    IntTuple single{5};
    EXPECT_TRUE(single.is_tuple());
    EXPECT_EQ(single.rank(), 1);
    EXPECT_NE(single, IntTuple(5));
    EXPECT_EQ(single.to_string(), "(5)");
}

TEST_F(IntTupleTest, EmptyTupleRejected) {
    EXPECT_THROW(IntTuple(std::vector<IntTuple>{}), StructureError);

    try {
        IntTuple empty(std::vector<IntTuple>{});
        FAIL() << "empty tuple accepted";
    } catch (const StructureError& e) {
        EXPECT_EQ(e.kind(), StructureErrorKind::EMPTY_TUPLE);
    }
}

TEST_F(IntTupleTest, WrongKindAccess) {
    EXPECT_THROW(flat_.value(), TypeError);
    EXPECT_THROW(scalar_.children(), TypeError);
    EXPECT_THROW(scalar_[0], TypeError);
}

TEST_F(IntTupleTest, IndexOutOfRange) {
    EXPECT_THROW(flat_[2], RangeError);
    EXPECT_THROW(flat_[-1], RangeError);
}

TEST_F(IntTupleTest, ToString) {
    EXPECT_EQ(scalar_.to_string(), "12");
    EXPECT_EQ(flat_.to_string(), "(4,8)");
    EXPECT_EQ(nested_.to_string(), "(12,(4,8))");
    EXPECT_EQ(to_string(IntTuple(-7)), "-7");

    std::ostringstream oss;
    oss << nested_;
    EXPECT_EQ(oss.str(), "(12,(4,8))");
}

TEST_F(IntTupleTest, Equality) {
    EXPECT_EQ(nested_, (IntTuple{12, {4, 8}}));
    EXPECT_NE(nested_, (IntTuple{12, {4, 9}}));
    EXPECT_NE(nested_, (IntTuple{12, 4, 8}));
    EXPECT_NE(flat_, scalar_);
    EXPECT_TRUE(scalar_ == IntTuple(12));
    EXPECT_FALSE(scalar_ != IntTuple(12));
}

TEST_F(IntTupleTest, MakeHelpers) {
    Shape shape = make_shape(12, make_shape(4, 8));
    Stride stride = make_stride(59, make_stride(13, 1));
    EXPECT_EQ(shape, nested_);
    EXPECT_EQ(stride, (IntTuple{59, {13, 1}}));
    EXPECT_EQ(layout_algebra::make_tuple(7).rank(), 1);
    EXPECT_TRUE(layout_algebra::make_tuple(7).is_tuple());
}

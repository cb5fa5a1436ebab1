#include "domain/value_objects/Dimensions.hpp"

#include <gtest/gtest.h>

using pqe::domain::Dimensions;
using pqe::domain::Exponent;

TEST(Dimensions, DefaultIsDimensionless) {
    Dimensions d;
    EXPECT_TRUE(d.is_zero());
    EXPECT_EQ(d.nonzero_count(), 0u);
    EXPECT_EQ(d, Dimensions::zero());
}

TEST(Dimensions, ConstructsFromSevenExponents) {
    Dimensions d(1, 1, -2, 0, 0, 0, 0);
    EXPECT_EQ(d[0], Exponent(1));
    EXPECT_EQ(d[1], Exponent(1));
    EXPECT_EQ(d[2], Exponent(-2));
    EXPECT_EQ(d.nonzero_count(), 3u);
    EXPECT_FALSE(d.is_zero());
}

TEST(Dimensions, BasisVectors) {
    EXPECT_EQ(Dimensions::basis(0), Dimensions(1, 0, 0, 0, 0, 0, 0));
    EXPECT_EQ(Dimensions::basis(6), Dimensions(0, 0, 0, 0, 0, 0, 1));
    EXPECT_THROW(Dimensions::basis(7), std::out_of_range);
}

TEST(Dimensions, IndexOutOfRangeThrows) {
    Dimensions d;
    EXPECT_THROW(d[7], std::out_of_range);
}

TEST(Dimensions, AddAndSubtract) {
    Dimensions force(1, 1, -2, 0, 0, 0, 0);
    Dimensions length(0, 1, 0, 0, 0, 0, 0);
    EXPECT_EQ(force.add(length), Dimensions(1, 2, -2, 0, 0, 0, 0));
    EXPECT_EQ(force.subtract(length), Dimensions(1, 0, -2, 0, 0, 0, 0));
    EXPECT_TRUE(force.subtract(force).is_zero());
}

TEST(Dimensions, MultiplyByRationalScalar) {
    Dimensions area(0, 2, 0, 0, 0, 0, 0);
    EXPECT_EQ(area.multiply(Exponent(1, 2)), Dimensions(0, 1, 0, 0, 0, 0, 0));

    auto root = Dimensions(0, 1, 0, 0, 0, 0, 0).multiply(Exponent(1, 2));
    EXPECT_EQ(root[1], Exponent(1, 2));
    EXPECT_EQ(root.multiply(Exponent(2)), Dimensions(0, 1, 0, 0, 0, 0, 0));
}

TEST(Dimensions, SingleComponent) {
    EXPECT_EQ(Dimensions(0, 0, -1, 0, 0, 0, 0).single_component(), 2u);
    EXPECT_FALSE(Dimensions(1, 1, 0, 0, 0, 0, 0).single_component().has_value());
    EXPECT_FALSE(Dimensions::zero().single_component().has_value());
}

TEST(Dimensions, FractionalExponentsCountAsNonZero) {
    auto root = Dimensions(1, 1, 0, 0, 0, 0, 0).multiply(Exponent(1, 2));
    EXPECT_EQ(root.nonzero_count(), 2u);
    EXPECT_FALSE(root.is_zero());
    EXPECT_FALSE(root.single_component().has_value());

    auto half_metre = Dimensions::basis(1).multiply(Exponent(1, 2));
    EXPECT_EQ(half_metre.nonzero_count(), 1u);
    EXPECT_EQ(half_metre.single_component(), 1u);
    EXPECT_EQ(Dimensions::basis(1).integer_multiple_of(half_metre), 2);
}

TEST(Dimensions, IntegerMultipleOf) {
    Dimensions hz(0, 0, -1, 0, 0, 0, 0);
    EXPECT_EQ(Dimensions(0, 0, -2, 0, 0, 0, 0).integer_multiple_of(hz), 2);
    EXPECT_EQ(Dimensions(0, 0, 3, 0, 0, 0, 0).integer_multiple_of(hz), -3);
    EXPECT_EQ(hz.integer_multiple_of(hz), 1);
}

TEST(Dimensions, IntegerMultipleOfRejectsNonMultiples) {
    Dimensions force(1, 1, -2, 0, 0, 0, 0);
    EXPECT_FALSE(force.integer_multiple_of(Dimensions::basis(0)).has_value());
    EXPECT_FALSE(Dimensions(0, 1, 0, 0, 0, 0, 0)
                     .integer_multiple_of(Dimensions(0, 2, 0, 0, 0, 0, 0))
                     .has_value());
    EXPECT_FALSE(Dimensions::zero().integer_multiple_of(force).has_value());
    EXPECT_FALSE(force.integer_multiple_of(Dimensions::zero()).has_value());
}

TEST(Dimensions, OrderingIsLexicographic) {
    EXPECT_LT(Dimensions(0, 1, 0, 0, 0, 0, 0), Dimensions(1, 0, 0, 0, 0, 0, 0));
    EXPECT_LT(Dimensions(1, 0, -2, 0, 0, 0, 0), Dimensions(1, 0, 0, 0, 0, 0, 0));
    EXPECT_FALSE(Dimensions::basis(1) < Dimensions::basis(1));
}

TEST(Dimensions, ToString) {
    EXPECT_EQ(Dimensions(1, 1, -2, 0, 0, 0, 0).to_string(), "Dimensions(1, 1, -2, 0, 0, 0, 0)");
    auto half = Dimensions::basis(1).multiply(Exponent(1, 2));
    EXPECT_EQ(half.to_string(), "Dimensions(0, 1/2, 0, 0, 0, 0, 0)");
}

TEST(Dimensions, ExponentToString) {
    EXPECT_EQ(pqe::domain::exponent_to_string(Exponent(-3)), "-3");
    EXPECT_EQ(pqe::domain::exponent_to_string(Exponent(-1, 2)), "-1/2");
}

#include <gtest/gtest.h>

#include "FriendlyInput.hpp"

/**
 * @brief Human-friendly amount parsing: separators, magnitude letters,
 * scientific literals.
 */
class FriendlyInputSuite : public ::testing::Test {
    // Stateless parser; no fixture setup required
};

TEST_F(FriendlyInputSuite, PlainAndScientificLiterals) {
    EXPECT_DOUBLE_EQ(FriendlyInput::parseAmount("42").value(), 42.0);
    EXPECT_DOUBLE_EQ(FriendlyInput::parseAmount("3.4e9").value(), 3.4e9);
    EXPECT_DOUBLE_EQ(FriendlyInput::parseAmount("0.25").value(), 0.25);
    EXPECT_DOUBLE_EQ(FriendlyInput::parseAmount("+7").value(), 7.0);
}

TEST_F(FriendlyInputSuite, ZeroIsAValidAmount) {
    auto zero = FriendlyInput::parseAmount("0");
    ASSERT_TRUE(zero.has_value());
    EXPECT_EQ(*zero, 0.0);
}

TEST_F(FriendlyInputSuite, ThousandsSeparatorsAreIgnored) {
    EXPECT_DOUBLE_EQ(FriendlyInput::parseAmount("1,250").value(), 1250.0);
    EXPECT_DOUBLE_EQ(FriendlyInput::parseAmount("12,345,678.5").value(), 12345678.5);
}

TEST_F(FriendlyInputSuite, MagnitudeLetters) {
    EXPECT_DOUBLE_EQ(FriendlyInput::parseAmount("12.5k").value(), 12500.0);
    EXPECT_DOUBLE_EQ(FriendlyInput::parseAmount("2M").value(), 2e6);
    EXPECT_DOUBLE_EQ(FriendlyInput::parseAmount("5 B").value(), 5e9);
    EXPECT_DOUBLE_EQ(FriendlyInput::parseAmount("7t").value(), 7e12);
    EXPECT_DOUBLE_EQ(FriendlyInput::parseAmount("1q").value(), 1e15);
    EXPECT_DOUBLE_EQ(FriendlyInput::parseAmount("1e3k").value(), 1e6);
}

TEST_F(FriendlyInputSuite, SurroundingWhitespaceIsTrimmed) {
    EXPECT_DOUBLE_EQ(FriendlyInput::parseAmount("   42  ").value(), 42.0);
    EXPECT_DOUBLE_EQ(FriendlyInput::parseAmount("\t1.5k\n").value(), 1500.0);
}

TEST_F(FriendlyInputSuite, RejectsMalformedText) {
    EXPECT_FALSE(FriendlyInput::parseAmount("").has_value());
    EXPECT_FALSE(FriendlyInput::parseAmount("   ").has_value());
    EXPECT_FALSE(FriendlyInput::parseAmount("abc").has_value());
    EXPECT_FALSE(FriendlyInput::parseAmount("k").has_value());
    EXPECT_FALSE(FriendlyInput::parseAmount("kk").has_value());
    EXPECT_FALSE(FriendlyInput::parseAmount("12kk").has_value());
    EXPECT_FALSE(FriendlyInput::parseAmount("12.5x").has_value());
    EXPECT_FALSE(FriendlyInput::parseAmount("1.2.3").has_value());
    EXPECT_FALSE(FriendlyInput::parseAmount("5k5").has_value());
}

TEST_F(FriendlyInputSuite, RejectsStackedSigns) {
    EXPECT_FALSE(FriendlyInput::parseAmount("+-5").has_value());
    EXPECT_FALSE(FriendlyInput::parseAmount("++5").has_value());
    EXPECT_FALSE(FriendlyInput::parseAmount("+-2k").has_value());
    EXPECT_DOUBLE_EQ(FriendlyInput::parseAmount("+5").value(), 5.0);
}

TEST_F(FriendlyInputSuite, RejectsNonFiniteResults) {
    EXPECT_FALSE(FriendlyInput::parseAmount("inf").has_value());
    EXPECT_FALSE(FriendlyInput::parseAmount("nan").has_value());
    EXPECT_FALSE(FriendlyInput::parseAmount("1e999").has_value());
    EXPECT_FALSE(FriendlyInput::parseAmount("1e300q").has_value());
}

TEST_F(FriendlyInputSuite, MagnitudeTable) {
    EXPECT_EQ(FriendlyInput::magnitudeFor('k'), 1e3);
    EXPECT_EQ(FriendlyInput::magnitudeFor('K'), 1e3);
    EXPECT_EQ(FriendlyInput::magnitudeFor('m'), 1e6);
    EXPECT_EQ(FriendlyInput::magnitudeFor('b'), 1e9);
    EXPECT_EQ(FriendlyInput::magnitudeFor('t'), 1e12);
    EXPECT_EQ(FriendlyInput::magnitudeFor('q'), 1e15);
    EXPECT_FALSE(FriendlyInput::magnitudeFor('x').has_value());
    EXPECT_FALSE(FriendlyInput::magnitudeFor('e').has_value());
}

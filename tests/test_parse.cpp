/**
 * @file test_parse.cpp
 * @brief Unit tests for unquoted token typing (GoogleTest)
 *
 * Tests aligned with actual Parse.cpp implementation:
 * - Only lowercase "true"/"false" for booleans
 * - Only "null" for null
 * - Whole-token numeric matches; anything else stays a string
 * - BigInt literals carry an `n` suffix
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "toon/Parse.hpp"
#include "toon/Value.hpp"

#include <stdexcept>

using namespace toon;

// ============================================================================
// Keywords
// ============================================================================

TEST(CoerceKeyword, Booleans) {
    EXPECT_EQ(coerce_scalar("true"), Value(true));
    EXPECT_EQ(coerce_scalar("false"), Value(false));
}

TEST(CoerceKeyword, Null) {
    EXPECT_TRUE(coerce_scalar("null").is_null());
}

TEST(CoerceKeyword, CaseSensitive) {
    // Only the lowercase spellings are keywords
    EXPECT_EQ(coerce_scalar("True"), Value("True"));
    EXPECT_EQ(coerce_scalar("NULL"), Value("NULL"));
}

// ============================================================================
// Integer Parsing
// ============================================================================

TEST(CoerceInteger, Values) {
    EXPECT_EQ(coerce_scalar("0"), Value(0));
    EXPECT_EQ(coerce_scalar("42"), Value(42));
    EXPECT_EQ(coerce_scalar("-17"), Value(-17));
    EXPECT_TRUE(coerce_scalar("42").as_number()->is_integer());
}

TEST(CoerceInteger, LeadingZeros) {
    Value v = coerce_scalar("007");
    ASSERT_TRUE(v.is_number());
    EXPECT_EQ(v.as_i64(), 7);
}

TEST(CoerceInteger, Overflow) {
    EXPECT_THROW(coerce_scalar("99999999999999999999"), std::out_of_range);
}

// ============================================================================
// Float Parsing
// ============================================================================

TEST(CoerceFloat, Values) {
    Value v = coerce_scalar("3.14");
    ASSERT_TRUE(v.is_number());
    EXPECT_TRUE(v.as_number()->is_float());
    EXPECT_DOUBLE_EQ(*v.as_f64(), 3.14);
    EXPECT_DOUBLE_EQ(*coerce_scalar("-0.5").as_f64(), -0.5);
}

TEST(CoerceFloat, UnderflowRoundsTowardZero) {
    Value tiny = coerce_scalar("1.0e-400");
    ASSERT_TRUE(tiny.is_number());
    EXPECT_TRUE(tiny.as_number()->is_float());
    EXPECT_EQ(*tiny.as_f64(), 0.0);

    Value negative = coerce_scalar("-2.5e-400");
    EXPECT_EQ(*negative.as_f64(), 0.0);

    Value denormal = coerce_scalar("4.9e-324");
    EXPECT_GT(*denormal.as_f64(), 0.0);
}

TEST(CoerceFloat, Overflow) {
    EXPECT_THROW(coerce_scalar("1.0e400"), std::out_of_range);
    EXPECT_THROW(coerce_scalar("-1.0e400"), std::out_of_range);
}

TEST(CoerceFloat, Exponent) {
    EXPECT_DOUBLE_EQ(*coerce_scalar("1.5e3").as_f64(), 1500.0);
    EXPECT_DOUBLE_EQ(*coerce_scalar("2.0E-2").as_f64(), 0.02);
}

TEST(CoerceFloat, IncompleteFormsStayStrings) {
    EXPECT_EQ(coerce_scalar("1."), Value("1."));
    EXPECT_EQ(coerce_scalar(".5"), Value(".5"));
    EXPECT_EQ(coerce_scalar("1.2.3"), Value("1.2.3"));
}

// ============================================================================
// Extended literals
// ============================================================================

TEST(CoerceBigInt, Suffix) {
    Value v = coerce_scalar("12345678901234567890n");
    ASSERT_TRUE(v.is_bigint());
    EXPECT_EQ(v.as_bigint()->to_string(), "12345678901234567890");
    EXPECT_EQ(coerce_scalar("-3n"), Value(BigInt(-3)));
}

TEST(CoerceSpecial, Floats) {
    EXPECT_EQ(coerce_scalar("Infinity").as_number()->kind(), Number::Kind::Infinity);
    EXPECT_EQ(coerce_scalar("-Infinity").as_number()->kind(), Number::Kind::NegativeInfinity);
    EXPECT_EQ(coerce_scalar("NaN").as_number()->kind(), Number::Kind::NaN);
    EXPECT_EQ(coerce_scalar("nan"), Value("nan"));
}

// ============================================================================
// Strings
// ============================================================================

TEST(CoerceString, PartialMatchesStayStrings) {
    EXPECT_EQ(coerce_scalar("3 apples"), Value("3 apples"));
    EXPECT_EQ(coerce_scalar("-abc"), Value("-abc"));
    EXPECT_EQ(coerce_scalar("nullable"), Value("nullable"));
    EXPECT_EQ(coerce_scalar("truer"), Value("truer"));
    EXPECT_EQ(coerce_scalar("+5"), Value("+5"));
}

TEST(CoerceString, Unicode) {
    EXPECT_EQ(coerce_scalar("\xE6\x97\xA5\xE6\x9C\xAC"), Value("\xE6\x97\xA5\xE6\x9C\xAC"));
}

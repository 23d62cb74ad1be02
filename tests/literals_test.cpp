//! # Literal Rendering Tests

#include "pyemit/printer/literals.hpp"

#include <gtest/gtest.h>
#include <limits>

using namespace pyemit;
using namespace pyemit::printer;
using ast::NumberKind;
using ast::NumberValue;

// ============================================================================
// Strings
// ============================================================================

TEST(QuoteStringTest, PlainAscii) {
    EXPECT_EQ(quote_string("hello world"), "\"hello world\"");
    EXPECT_EQ(quote_string(""), "\"\"");
}

TEST(QuoteStringTest, NamedEscapes) {
    EXPECT_EQ(quote_string("a\"b'c\\d"), "\"a\\\"b\\'c\\\\d\"");
    EXPECT_EQ(quote_string("\n\r\t\b\f"), "\"\\n\\r\\t\\b\\f\"");
}

TEST(QuoteStringTest, ControlCharactersAsHex) {
    EXPECT_EQ(quote_string(std::string("\x01\x1f\x7f", 3)), "\"\\x01\\x1f\\x7f\"");
    EXPECT_EQ(quote_string(std::string("a\0b", 3)), "\"a\\x00b\"");
}

TEST(QuoteStringTest, NonAsciiCodePoints) {
    EXPECT_EQ(quote_string("caf\xc3\xa9"), "\"caf\\u00e9\"");
    EXPECT_EQ(quote_string("\xe2\x82\xac"), "\"\\u20ac\"");
    EXPECT_EQ(quote_string("\xf0\x9f\x98\x80"), "\"\\U0001f600\"");
}

TEST(QuoteStringTest, MalformedUtf8BytesAsHex) {
    EXPECT_EQ(quote_string("a\xff"
                           "b"),
              "\"a\\xffb\"");
    // Truncated two-byte sequence.
    EXPECT_EQ(quote_string("\xc3"), "\"\\xc3\"");
    // Overlong encoding of '/'.
    EXPECT_EQ(quote_string("\xc0\xaf"), "\"\\xc0\\xaf\"");
}

// ============================================================================
// Numbers
// ============================================================================

TEST(FormatNumberTest, IntegralKinds) {
    EXPECT_EQ(format_number({42, NumberKind::Int32}), "42");
    EXPECT_EQ(format_number({-7, NumberKind::Int8}), "-7");
    EXPECT_EQ(format_number({4294967295.0, NumberKind::UInt32}), "4294967295");
    EXPECT_EQ(format_number({0, NumberKind::UInt16}), "0");
}

TEST(FormatNumberTest, FloatKinds) {
    EXPECT_EQ(format_number({1.5, NumberKind::Float64}), "1.5");
    EXPECT_EQ(format_number({42.0, NumberKind::Float64}), "42.0");
    EXPECT_EQ(format_number({0.1, NumberKind::Float64}), "0.1");
    EXPECT_EQ(format_number({1e21, NumberKind::Float64}), "1e+21");
    EXPECT_EQ(format_number({-0.0, NumberKind::Float64}), "-0.0");
}

TEST(FormatNumberTest, Float32WidenedValue) {
    EXPECT_EQ(format_number({static_cast<double>(0.1f), NumberKind::Float32}),
              "0.10000000149011612");
}

TEST(FormatNumberTest, NonFinite) {
    constexpr double inf = std::numeric_limits<double>::infinity();
    EXPECT_EQ(format_number({inf, NumberKind::Float64}), "float(\"inf\")");
    EXPECT_EQ(format_number({-inf, NumberKind::Float64}), "float(\"-inf\")");
    EXPECT_EQ(format_number({std::numeric_limits<double>::quiet_NaN(), NumberKind::Float64}),
              "float(\"nan\")");
}

// ============================================================================
// Constants
// ============================================================================

TEST(FormatConstantTest, EveryKind) {
    EXPECT_EQ(format_constant(true), "True");
    EXPECT_EQ(format_constant(false), "False");
    EXPECT_EQ(format_constant(ast::NoneValue{}), "None");
    EXPECT_EQ(format_constant(std::string("x")), "\"x\"");
    EXPECT_EQ(format_constant(NumberValue{3, NumberKind::Int32}), "3");
}

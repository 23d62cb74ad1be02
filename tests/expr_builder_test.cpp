//! # Expression Builder Tests
//!
//! Literal construction and runtime type tests, checked through the printed
//! target text, plus the diagnostics for pairings the runtime cannot express.

#include "print_fixture.hpp"
#include "pyemit/builder/expr_builder.hpp"

using namespace pyemit;
using namespace pyemit::test;
using builder::DecimalValue;
using builder::LiteralValue;
using types::ExtendedKind;

class ExprBuilderTest : public PrintFixture {
protected:
    builder::ExprBuilder builder_{diagnostics};

    auto literal(const types::TypePtr& type, const LiteralValue& value) -> std::string {
        auto e = builder_.make_type_const(*type, value);
        return print(*e);
    }

    auto type_test(const types::TypePtr& type) -> std::string {
        auto e = builder_.make_type_test(*type, name("x"));
        return print(*e);
    }

    auto last_code() const -> std::string {
        return diagnostics.diagnostics().empty() ? "" : diagnostics.diagnostics().back().code;
    }
};

// ============================================================================
// 64-bit Integers
// ============================================================================

TEST_F(ExprBuilderTest, Int64FromBits) {
    EXPECT_EQ(literal(types::make_extended(ExtendedKind::Int64), int64_t{42}),
              "long.from_bits(42.0, 0.0, False)");
    EXPECT_FALSE(diagnostics.has_errors());
}

TEST_F(ExprBuilderTest, NegativeInt64UsesTwosComplementLimbs) {
    EXPECT_EQ(literal(types::make_extended(ExtendedKind::Int64), int64_t{-1}),
              "long.from_bits(4294967295.0, 4294967295.0, False)");
}

TEST_F(ExprBuilderTest, UInt64HighLimb) {
    EXPECT_EQ(literal(types::make_extended(ExtendedKind::UInt64), uint64_t{1} << 32),
              "long.from_bits(0.0, 1.0, True)");
}

TEST_F(ExprBuilderTest, Int64RequiresInt64Value) {
    EXPECT_EQ(literal(types::make_extended(ExtendedKind::Int64), int32_t{1}), "None");
    EXPECT_EQ(last_code(), diag::codes::LITERAL_TYPE_MISMATCH);
}

// ============================================================================
// Scalars
// ============================================================================

TEST_F(ExprBuilderTest, UnitIgnoresValue) {
    EXPECT_EQ(literal(types::make_unit(), std::monostate{}), "None");
    EXPECT_EQ(literal(types::make_unit(), int32_t{3}), "None");
    EXPECT_FALSE(diagnostics.has_errors());
}

TEST_F(ExprBuilderTest, BooleanAndString) {
    EXPECT_EQ(literal(types::make_boolean(), true), "True");
    EXPECT_EQ(literal(types::make_string(), std::string("hi\n")), "\"hi\\n\"");
}

TEST_F(ExprBuilderTest, CharIsOneCodePointString) {
    EXPECT_EQ(literal(types::make_char(), U'a'), "\"a\"");
    EXPECT_EQ(literal(types::make_char(), U'\u00e9'), "\"\\u00e9\"");
}

TEST_F(ExprBuilderTest, SurrogateCharIsRejected) {
    EXPECT_EQ(literal(types::make_char(), static_cast<char32_t>(0xD800)), "None");
    EXPECT_EQ(last_code(), diag::codes::LITERAL_TYPE_MISMATCH);
}

TEST_F(ExprBuilderTest, NumbersMatchTheirKind) {
    EXPECT_EQ(literal(types::make_number(ast::NumberKind::Int32), int32_t{-5}), "-5");
    EXPECT_EQ(literal(types::make_number(ast::NumberKind::UInt8), uint8_t{255}), "255");
    EXPECT_EQ(literal(types::make_number(ast::NumberKind::Float64), 2.5), "2.5");
    EXPECT_FALSE(diagnostics.has_errors());
}

TEST_F(ExprBuilderTest, Float32GoesThroughFround) {
    EXPECT_EQ(literal(types::make_number(ast::NumberKind::Float32), 0.1f),
              "util.fround(0.10000000149011612)");
}

TEST_F(ExprBuilderTest, NumberKindMismatchIsReported) {
    EXPECT_EQ(literal(types::make_number(ast::NumberKind::Int32), 1.0), "None");

    ASSERT_EQ(diagnostics.diagnostics().size(), 1u);
    EXPECT_EQ(diagnostics.diagnostics()[0].code, diag::codes::LITERAL_TYPE_MISMATCH);
    EXPECT_EQ(diagnostics.diagnostics()[0].message,
              "cannot build a int32 literal from a float64 value");
}

TEST_F(ExprBuilderTest, DecimalBecomesFloat64) {
    EXPECT_EQ(literal(types::make_extended(ExtendedKind::Decimal), DecimalValue{"+1.25"}),
              "1.25");
}

TEST_F(ExprBuilderTest, MalformedDecimalIsReported) {
    EXPECT_EQ(literal(types::make_extended(ExtendedKind::Decimal), DecimalValue{"1.2.3"}),
              "None");
    EXPECT_EQ(last_code(), diag::codes::LITERAL_TYPE_MISMATCH);
}

TEST_F(ExprBuilderTest, BigIntHasNoLiteral) {
    EXPECT_EQ(literal(types::make_extended(ExtendedKind::BigInt), std::string("12345")), "None");
    EXPECT_EQ(diagnostics.diagnostics().back().message,
              "cannot build a bigint literal from a string value");
}

// ============================================================================
// Enums and Arrays
// ============================================================================

TEST_F(ExprBuilderTest, EnumLiteralCallsEnum) {
    EXPECT_EQ(literal(types::make_enum("Color"), int32_t{2}), "Color(2)");
    EXPECT_EQ(literal(types::make_enum("Flags"), uint8_t{1}), "Flags(1)");
}

TEST_F(ExprBuilderTest, SixtyFourBitEnumIsReported) {
    EXPECT_EQ(literal(types::make_enum("Big"), int64_t{1}), "None");

    ASSERT_EQ(diagnostics.diagnostics().size(), 1u);
    EXPECT_EQ(diagnostics.diagnostics()[0].code, diag::codes::ENUM_64_BIT);
    EXPECT_EQ(diagnostics.diagnostics()[0].message,
              "64-bit enum Big has no literal representation");
}

TEST_F(ExprBuilderTest, NumericArrayBecomesList) {
    auto bytes = types::make_array(types::make_number(ast::NumberKind::UInt8));
    EXPECT_EQ(literal(bytes, std::vector<uint8_t>{1, 2, 3}), "[1, 2, 3]");

    auto words = types::make_array(types::make_number(ast::NumberKind::UInt16));
    EXPECT_EQ(literal(words, std::vector<uint16_t>{65535}), "[65535]");
}

TEST_F(ExprBuilderTest, ArrayOfStringsHasNoLiteral) {
    auto strings = types::make_array(types::make_string());
    EXPECT_EQ(literal(strings, std::vector<uint8_t>{1}), "None");
    EXPECT_EQ(diagnostics.diagnostics().back().message,
              "cannot build a string[] literal from a uint8[] value");
}

TEST_F(ExprBuilderTest, LiteralKeepsLocation) {
    auto loc = loc_at(9, 3);
    auto e = builder_.make_type_const(*types::make_boolean(), false, loc);
    ASSERT_TRUE(e->loc.has_value());
    EXPECT_EQ(*e->loc, loc);
}

// ============================================================================
// Type Tests
// ============================================================================

TEST_F(ExprBuilderTest, AnyIsAlwaysTrue) {
    EXPECT_EQ(type_test(types::make_any()), "True");
}

TEST_F(ExprBuilderTest, UnitTestsForNone) {
    EXPECT_EQ(type_test(types::make_unit()), "x is None");
}

TEST_F(ExprBuilderTest, PrimitiveTypesUseTypeOf) {
    EXPECT_EQ(type_test(types::make_boolean()), "(util.type_of(x)) == \"boolean\"");
    EXPECT_EQ(type_test(types::make_char()), "(util.type_of(x)) == \"string\"");
    EXPECT_EQ(type_test(types::make_string()), "(util.type_of(x)) == \"string\"");
    EXPECT_EQ(type_test(types::make_number(ast::NumberKind::Float64)),
              "(util.type_of(x)) == \"number\"");
    EXPECT_EQ(type_test(types::make_enum("Color")), "(util.type_of(x)) == \"number\"");
    EXPECT_EQ(type_test(types::make_func({types::make_any()}, types::make_unit())),
              "(util.type_of(x)) == \"function\"");
}

TEST_F(ExprBuilderTest, RuntimeClassesUseIsInstance) {
    EXPECT_EQ(type_test(types::make_regex()), "isinstance(x, re.Pattern)");
    EXPECT_EQ(type_test(types::make_extended(ExtendedKind::Int64)), "isinstance(x, long.Long)");
    EXPECT_EQ(type_test(types::make_extended(ExtendedKind::UInt64)), "isinstance(x, long.Long)");
    EXPECT_EQ(type_test(types::make_extended(ExtendedKind::Decimal)),
              "isinstance(x, decimal.Decimal)");
    EXPECT_EQ(type_test(types::make_extended(ExtendedKind::BigInt)),
              "isinstance(x, big_int.BigInteger)");
}

TEST_F(ExprBuilderTest, SequencesAreArrayLike) {
    auto number = types::make_number(ast::NumberKind::Int32);
    EXPECT_EQ(type_test(types::make_array(number)), "util.is_array_like(x)");
    EXPECT_EQ(type_test(types::make_tuple({number, number})), "util.is_array_like(x)");
    EXPECT_EQ(type_test(types::make_list(number)), "util.is_array_like(x)");
    EXPECT_FALSE(diagnostics.has_errors());
}

TEST_F(ExprBuilderTest, DeclaredTypeIsReported) {
    auto shape = types::make_declared("Shape", types::DeclaredKind::Union);
    auto e = builder_.make_type_test(*shape, name("x"), loc_at(12, 4));
    EXPECT_EQ(print(*e), "None");

    ASSERT_EQ(diagnostics.diagnostics().size(), 1u);
    EXPECT_EQ(format_diagnostic(diagnostics.diagnostics()[0]),
              "in.fs:12:4: error[P001]: cannot type test against Shape at runtime");
}

TEST_F(ExprBuilderTest, ErasedTypesAreReported) {
    EXPECT_EQ(type_test(types::make_option(types::make_string())), "None");
    EXPECT_EQ(type_test(types::make_generic_param("T")), "None");
    EXPECT_EQ(type_test(types::make_erased_union({types::make_string()})), "None");

    ASSERT_EQ(diagnostics.diagnostics().size(), 3u);
    for (const auto& d : diagnostics.diagnostics()) {
        EXPECT_EQ(d.code, diag::codes::UNSUPPORTED_TYPE_TEST);
    }
    EXPECT_EQ(diagnostics.diagnostics()[0].message,
              "cannot type test against string option at runtime");
}

// ============================================================================
// Runtime Names
// ============================================================================

TEST_F(ExprBuilderTest, CustomRuntimeNames) {
    builder::RuntimeNames names;
    names.util_module = "rt";
    names.type_of = "kind";
    builder::ExprBuilder custom(diagnostics, names);

    auto e = custom.make_type_test(*types::make_boolean(), name("v"));
    EXPECT_EQ(print(*e), "(rt.kind(v)) == \"boolean\"");
    EXPECT_EQ(custom.names().long_class, "Long");
}

TEST_F(ExprBuilderTest, CoreCall) {
    auto e = builder_.make_core_call("util", "range", ast::make_vec<ast::ExprPtr>(int_const(3)));
    EXPECT_EQ(print(*e), "util.range(3)");
}

// ============================================================================
// Abort Policy
// ============================================================================

class ExprBuilderAbortTest : public ::testing::Test {
protected:
    diag::DiagnosticSink diagnostics{"in.fs", diag::FailurePolicy::Abort};
    builder::ExprBuilder builder_{diagnostics};
};

TEST_F(ExprBuilderAbortTest, DeclaredTypeTestThrows) {
    auto shape = types::make_declared("Shape", types::DeclaredKind::Record);
    EXPECT_THROW((void)builder_.make_type_test(*shape, name("x")), diag::FatalTranslationError);
    EXPECT_EQ(diagnostics.error_count(), 1u);
}

TEST_F(ExprBuilderAbortTest, ErasedTypeTestThrows) {
    EXPECT_THROW((void)builder_.make_type_test(*types::make_generic_param("T"), name("x")),
                 diag::FatalTranslationError);
}

TEST_F(ExprBuilderAbortTest, LiteralMismatchThrows) {
    try {
        (void)builder_.make_type_const(*types::make_boolean(), int32_t{1});
        FAIL() << "expected FatalTranslationError";
    } catch (const diag::FatalTranslationError& e) {
        EXPECT_EQ(e.diagnostic().code, diag::codes::LITERAL_TYPE_MISMATCH);
    }
}

TEST_F(ExprBuilderAbortTest, SixtyFourBitEnumThrows) {
    EXPECT_THROW((void)builder_.make_type_const(*types::make_enum("Big"), uint64_t{7}),
                 diag::FatalTranslationError);
}

TEST_F(ExprBuilderAbortTest, SupportedTestsDoNotThrow) {
    EXPECT_NO_THROW((void)builder_.make_type_test(*types::make_string(), name("x")));
    EXPECT_EQ(diagnostics.error_count(), 0u);
}

//! # Expression Printing Tests
//!
//! Operators and parenthesization, calls and receivers, parameter lists,
//! displays, emit templates, and the unsupported-construct placeholder.

#include "print_fixture.hpp"

using namespace pyemit;
using namespace pyemit::test;
using ast::ExprPtr;
using ast::make_vec;

class PrintExprTest : public PrintFixture {};

// ============================================================================
// Operators
// ============================================================================

TEST_F(PrintExprTest, NestedBinOpIsParenthesized) {
    auto right = ast::make_bin_op(name("b"), ast::Operator::Mult, name("c"));
    auto e = ast::make_bin_op(name("a"), ast::Operator::Add, std::move(right));
    EXPECT_EQ(print(*e), "a + (b * c)");
}

TEST_F(PrintExprTest, LeftNestedBinOpKeepsGrouping) {
    auto left = ast::make_bin_op(name("a"), ast::Operator::Add, name("b"));
    auto e = ast::make_bin_op(std::move(left), ast::Operator::Mult, name("c"));
    EXPECT_EQ(print(*e), "(a + b) * c");
}

TEST_F(PrintExprTest, NegativeConstantOperandIsParenthesized) {
    auto e = ast::make_bin_op(ast::make_number(-1, ast::NumberKind::Int32), ast::Operator::Pow,
                              int_const(2));
    EXPECT_EQ(print(*e), "(-1) ** 2");
}

TEST_F(PrintExprTest, UnaryOperators) {
    auto neg = ast::make_unary_op(ast::UnaryOperator::USub,
                                  ast::make_bin_op(name("a"), ast::Operator::Add, name("b")));
    EXPECT_EQ(print(*neg), "-(a + b)");

    auto inv = ast::make_unary_op(ast::UnaryOperator::Not, name("done"));
    EXPECT_EQ(print(*inv), "not done");
}

TEST_F(PrintExprTest, BoolOpWithComparison) {
    auto cmp = ast::make_compare(name("b"), ast::ComparisonOperator::Lt, name("c"));
    auto e =
        ast::make_bool_op(ast::BoolOperator::And, make_vec<ExprPtr>(name("a"), std::move(cmp)));
    EXPECT_EQ(print(*e), "a and (b < c)");
}

TEST_F(PrintExprTest, ComparisonChain) {
    auto e = expr(ast::Expr{.kind = ast::Compare{
                                .left = name("a"),
                                .ops = {ast::ComparisonOperator::Lt, ast::ComparisonOperator::LtE},
                                .comparators = make_vec<ExprPtr>(name("b"), name("c")),
                            }});
    EXPECT_EQ(print(*e), "a < b <= c");
}

TEST_F(PrintExprTest, IsNotNone) {
    auto e = ast::make_compare(name("x"), ast::ComparisonOperator::IsNot, ast::make_none());
    EXPECT_EQ(print(*e), "x is not None");
}

TEST_F(PrintExprTest, ConditionalExpression) {
    auto e = ast::make_if_exp(name("c"), name("a"), name("b"));
    EXPECT_EQ(print(*e), "a if (c) else (b)");
}

// ============================================================================
// Calls and Receivers
// ============================================================================

TEST_F(PrintExprTest, CallWithKeywordsAndDoubleStar) {
    auto keywords = make_vec<ast::Keyword>(ast::Keyword{.arg = "key", .value = name("x")},
                                           ast::Keyword{.value = name("kw")});
    auto e = ast::make_call(name("f"), make_vec<ExprPtr>(name("a"), int_const(1)),
                            std::move(keywords));
    EXPECT_EQ(print(*e), "f(a, 1, key=x, **kw)");
}

TEST_F(PrintExprTest, CallWithOnlyKeywords) {
    auto keywords = make_vec<ast::Keyword>(ast::Keyword{.arg = "k", .value = int_const(1)});
    auto e = ast::make_call(name("f"), {}, std::move(keywords));
    EXPECT_EQ(print(*e), "f(k=1)");
}

TEST_F(PrintExprTest, CallOfCallResult) {
    auto inner = ast::make_call(name("f"), make_vec<ExprPtr>(name("x")));
    auto e = ast::make_call(std::move(inner), make_vec<ExprPtr>(name("y")));
    EXPECT_EQ(print(*e), "f(x)(y)");
}

TEST_F(PrintExprTest, AttributeOfOperationIsParenthesized) {
    auto sum = ast::make_bin_op(name("a"), ast::Operator::Add, name("b"));
    auto e = ast::make_attribute(std::move(sum), "real");
    EXPECT_EQ(print(*e), "(a + b).real");
}

TEST_F(PrintExprTest, AttributeOfNumberIsParenthesized) {
    auto e = ast::make_attribute(int_const(1), "real");
    EXPECT_EQ(print(*e), "(1).real");
}

TEST_F(PrintExprTest, AttributeOfStringIsBare) {
    auto e = ast::make_attribute(ast::make_string("s"), "upper");
    EXPECT_EQ(print(*e), "\"s\".upper");
}

TEST_F(PrintExprTest, SubscriptOfName) {
    auto e = ast::make_subscript(name("xs"), int_const(0));
    EXPECT_EQ(print(*e), "xs[0]");
}

// ============================================================================
// Functions
// ============================================================================

TEST_F(PrintExprTest, Lambda) {
    ast::Arguments args;
    args.args = make_vec<ast::Arg>(ast::make_arg("x"), ast::make_arg("y"));
    auto e = ast::make_lambda(std::move(args),
                              ast::make_bin_op(name("x"), ast::Operator::Add, name("y")));
    EXPECT_EQ(print(*e), "lambda x, y: x + y");
}

TEST_F(PrintExprTest, LambdaWithoutParameters) {
    auto e = ast::make_lambda({}, int_const(0));
    EXPECT_EQ(print(*e), "lambda: 0");
}

TEST_F(PrintExprTest, FullParameterList) {
    ast::Arguments args;
    args.posonlyargs = make_vec<ast::Arg>(ast::make_arg("a"));
    args.args = make_vec<ast::Arg>(ast::make_arg("b"), ast::make_arg("c"));
    args.defaults = make_vec<ExprPtr>(int_const(1));
    args.vararg = ast::make_arg("args");
    args.kwarg = ast::make_arg("kwargs");
    auto e = ast::make_lambda(std::move(args), ast::make_none());

    EXPECT_EQ(print(*e), "lambda a, /, b, c=1, *args, **kwargs: None");
}

TEST_F(PrintExprTest, AnnotatedParameter) {
    ast::Arguments args;
    args.args.push_back(ast::Arg{.arg = "x", .annotation = name("int")});
    auto s = ast::make_function_def("f", std::move(args), {});
    EXPECT_EQ(print(*s), "def f(x: int):\n"
                         "    pass\n"
                         "\n");
}

// ============================================================================
// Displays
// ============================================================================

TEST_F(PrintExprTest, EmptyTuple) {
    EXPECT_EQ(print(*ast::make_tuple({})), "()");
}

TEST_F(PrintExprTest, SingleElementTupleHasTrailingComma) {
    EXPECT_EQ(print(*ast::make_tuple(make_vec<ExprPtr>(name("x")))), "(x,)");
}

TEST_F(PrintExprTest, PairTuple) {
    EXPECT_EQ(print(*ast::make_tuple(make_vec<ExprPtr>(name("x"), name("y")))), "(x, y)");
}

TEST_F(PrintExprTest, List) {
    EXPECT_EQ(print(*ast::make_list(make_vec<ExprPtr>(int_const(1), int_const(2)))), "[1, 2]");
}

TEST_F(PrintExprTest, Sets) {
    EXPECT_EQ(print(*ast::make_set({})), "set()");
    EXPECT_EQ(print(*ast::make_set(make_vec<ExprPtr>(name("a"), name("b")))), "{a, b}");
}

TEST_F(PrintExprTest, EmptyDict) {
    EXPECT_EQ(print(*ast::make_dict({}, {})), "{}");
}

TEST_F(PrintExprTest, DictOnePairPerLine) {
    auto e = ast::make_dict(make_vec<ExprPtr>(ast::make_string("a"), ast::make_string("b")),
                            make_vec<ExprPtr>(int_const(1), int_const(2)));
    EXPECT_EQ(print(*e), "{\n"
                         "    \"a\": 1,\n"
                         "    \"b\": 2\n"
                         "}");
}

// ============================================================================
// Other Expressions
// ============================================================================

TEST_F(PrintExprTest, NamedExpression) {
    auto call = ast::make_call(name("f"), make_vec<ExprPtr>(name("x")));
    auto e = ast::make_named_expr(name("y"), std::move(call));
    EXPECT_EQ(print(*e), "(y := f(x))");
}

TEST_F(PrintExprTest, NamedExpressionIsNotParenthesizedTwice) {
    auto sum = ast::make_bin_op(ast::make_named_expr(name("n"), int_const(1)), ast::Operator::Add,
                                name("m"));
    EXPECT_EQ(print(*sum), "(n := 1) + m");

    auto attr = ast::make_attribute(ast::make_named_expr(name("n"), name("x")), "real");
    EXPECT_EQ(print(*attr), "(n := x).real");
}

TEST_F(PrintExprTest, NamedExpressionAsLambdaBody) {
    auto fn = ast::make_lambda({}, ast::make_named_expr(name("x"), int_const(1)));
    EXPECT_EQ(print(*fn), "lambda: (x := 1)");
}

TEST_F(PrintExprTest, Starred) {
    EXPECT_EQ(print(*ast::make_starred(name("args"))), "*args");
}

TEST_F(PrintExprTest, YieldForms) {
    auto value = expr(ast::Expr{.kind = ast::Yield{.value = name("x")}});
    EXPECT_EQ(print(*value), "yield x");

    auto from = expr(ast::Expr{.kind = ast::YieldFrom{.value = name("gen")}});
    EXPECT_EQ(print(*from), "yield from gen");
}

TEST_F(PrintExprTest, Constants) {
    EXPECT_EQ(print(*ast::make_number(1.5, ast::NumberKind::Float64)), "1.5");
    EXPECT_EQ(print(*ast::make_bool(false)), "False");
    EXPECT_EQ(print(*ast::make_string("a\nb")), "\"a\\nb\"");
}

// ============================================================================
// Emit
// ============================================================================

TEST_F(PrintExprTest, EmitSubstitutesArguments) {
    auto e = ast::make_emit("$0 + $1", make_vec<ExprPtr>(name("a"), name("b")));
    EXPECT_EQ(print(*e), "a + b");
}

TEST_F(PrintExprTest, EmitSpread) {
    auto e = ast::make_emit("f($0...)", make_vec<ExprPtr>(name("a"), name("b"), name("c")));
    EXPECT_EQ(print(*e), "f(a, b, c)");
}

TEST_F(PrintExprTest, EmitSpreadPastLastArgumentIsEmpty) {
    auto e = ast::make_emit("g($1...)", make_vec<ExprPtr>(name("a")));
    EXPECT_EQ(print(*e), "g()");
}

TEST_F(PrintExprTest, EmitConditionalOnConstantArgument) {
    auto constant = ast::make_emit("{{$0?yes:no}}", make_vec<ExprPtr>(int_const(1)));
    EXPECT_EQ(print(*constant), "yes");

    auto variable = ast::make_emit("{{$0?yes:no}}", make_vec<ExprPtr>(name("x")));
    EXPECT_EQ(print(*variable), "no");
}

TEST_F(PrintExprTest, EmitPresenceBlock) {
    auto one = ast::make_emit("f($0{{, $1}})", make_vec<ExprPtr>(name("x")));
    EXPECT_EQ(print(*one), "f(x)");

    auto two = ast::make_emit("f($0{{, $1}})", make_vec<ExprPtr>(name("x"), name("y")));
    EXPECT_EQ(print(*two), "f(x, y)");
}

TEST_F(PrintExprTest, EmitMissingArgumentPrintsNone) {
    auto e = ast::make_emit("f($1)", make_vec<ExprPtr>(name("x")));
    EXPECT_EQ(print(*e), "f(None)");
}

TEST_F(PrintExprTest, EmitArgumentsAreOperands) {
    auto negative = ast::make_number(-3, ast::NumberKind::Int32);
    auto e = ast::make_emit("$0 * 2", make_vec<ExprPtr>(std::move(negative)));
    EXPECT_EQ(print(*e), "(-3) * 2");
}

TEST_F(PrintExprTest, EmitLinesFollowIndentation) {
    auto body = make_vec<ast::StmtPtr>(ast::make_expr_stmt(ast::make_emit("a()\r\n    b()", {})));
    auto s = ast::make_function_def("f", {}, std::move(body));
    EXPECT_EQ(print(*s), "def f():\n"
                         "    a()\n"
                         "    b()\n"
                         "\n");
}

TEST_F(PrintExprTest, EmitTemplatesAreCompiledOncePerShape) {
    auto first = ast::make_emit("$0 + $1", make_vec<ExprPtr>(name("a"), name("b")));
    auto second = ast::make_emit("$0 + $1", make_vec<ExprPtr>(name("c"), name("d")));
    auto constant = ast::make_emit("$0 + $1", make_vec<ExprPtr>(int_const(1), name("d")));
    print(*first);
    print(*second);
    print(*constant);

    EXPECT_EQ(dispatch.templates().size(), 2u);
    EXPECT_EQ(dispatch.templates().hits(), 1u);
}

// ============================================================================
// Unsupported
// ============================================================================

TEST_F(PrintExprTest, UnsupportedPrintsNoneAndRecovers) {
    auto e = ast::make_unsupported("FormattedValue", loc_at(4, 2));
    EXPECT_EQ(print(*e), "None");

    ASSERT_EQ(diagnostics.diagnostics().size(), 1u);
    const auto& d = diagnostics.diagnostics()[0];
    EXPECT_EQ(d.code, diag::codes::UNSUPPORTED_NODE);
    EXPECT_EQ(format_diagnostic(d), "in.fs:4:2: error[P005]: cannot print FormattedValue yet");
}

TEST(PrintUnsupportedAbortTest, ThrowsAfterRecording) {
    std::string out;
    sourcemap::NullSourceMap map;
    diag::DiagnosticSink diagnostics("in.fs", diag::FailurePolicy::Abort);
    printer::Printer p(make_box<io::StringWriter>(out), map);
    printer::PrintDispatch dispatch(p, diagnostics);

    auto e = ast::make_unsupported("JoinedStr");
    EXPECT_THROW(dispatch.print_expr(*e), diag::FatalTranslationError);
    EXPECT_EQ(diagnostics.error_count(), 1u);
    EXPECT_EQ(p.buffer(), "");
}

// ============================================================================
// Source Locations
// ============================================================================

TEST_F(PrintExprTest, NodeMappedAtItsFirstCharacter) {
    auto sum = ast::make_bin_op(ast::make_name("a", loc_at(1, 10)), ast::Operator::Add,
                                ast::make_name("b", loc_at(1, 14)), loc_at(1, 10));
    auto s = ast::make_assign(name("x"), std::move(sum), loc_at(1, 6));
    print(*s);

    ASSERT_EQ(map.mappings().size(), 4u);
    EXPECT_EQ(map.mappings()[0].generated_column, 0u);
    EXPECT_EQ(map.mappings()[0].original_column, 6u);
    EXPECT_EQ(map.mappings()[1].generated_column, 4u);
    EXPECT_EQ(map.mappings()[2].generated_column, 4u);
    EXPECT_EQ(map.mappings()[3].generated_column, 8u);
    EXPECT_EQ(map.mappings()[3].original_column, 14u);
}

//! # Target AST
//!
//! Main header for the target-language AST consumed by the printer.
//!
//! ## Architecture
//!
//! The AST is a closed set of variants in two categories:
//!
//! - **Expressions**: value-producing constructs (`Expr`, see `ast_exprs.hpp`)
//! - **Statements**: everything else, rooted at a `Module` (see `ast_stmts.hpp`)
//!
//! Every consumer dispatches with `std::visit` and an `if constexpr` chain that
//! ends in a `static_assert`, so adding a variant breaks the build at every
//! site that does not handle it yet.
//!
//! ## Factory Functions
//!
//! The `make_*` functions below wrap node construction in `Box<T>`. They are
//! what the expression builder and the tests use to assemble trees.

#ifndef PYEMIT_AST_HPP
#define PYEMIT_AST_HPP

#include "pyemit/ast/ast_common.hpp"
#include "pyemit/ast/ast_exprs.hpp"
#include "pyemit/ast/ast_stmts.hpp"

namespace pyemit::ast {

using Loc = std::optional<SourceLocation>;

// ============================================================================
// Vector Helpers
// ============================================================================

/// Builds a vector of move-only nodes, which an initializer list cannot do.
///
/// ```cpp
/// auto args = make_vec<ExprPtr>(make_name("a"), make_name("b"));
/// ```
template <typename T, typename... Ts> auto make_vec(Ts&&... items) -> std::vector<T> {
    std::vector<T> out;
    out.reserve(sizeof...(items));
    (out.push_back(std::forward<Ts>(items)), ...);
    return out;
}

// ============================================================================
// Expression Factories
// ============================================================================

auto make_name(Identifier id, Loc loc = std::nullopt) -> ExprPtr;
auto make_constant(ConstantValue value, Loc loc = std::nullopt) -> ExprPtr;
auto make_bool(bool value, Loc loc = std::nullopt) -> ExprPtr;
auto make_string(std::string value, Loc loc = std::nullopt) -> ExprPtr;
auto make_number(double value, NumberKind kind, Loc loc = std::nullopt) -> ExprPtr;
auto make_none(Loc loc = std::nullopt) -> ExprPtr;

auto make_call(ExprPtr func, std::vector<ExprPtr> args, std::vector<Keyword> keywords = {},
               Loc loc = std::nullopt) -> ExprPtr;
auto make_attribute(ExprPtr value, Identifier attr, Loc loc = std::nullopt) -> ExprPtr;
auto make_subscript(ExprPtr value, ExprPtr slice, Loc loc = std::nullopt) -> ExprPtr;

auto make_bin_op(ExprPtr left, Operator op, ExprPtr right, Loc loc = std::nullopt) -> ExprPtr;
auto make_unary_op(UnaryOperator op, ExprPtr operand, Loc loc = std::nullopt) -> ExprPtr;
auto make_bool_op(BoolOperator op, std::vector<ExprPtr> values, Loc loc = std::nullopt)
    -> ExprPtr;

/// Single comparison `left op right`.
auto make_compare(ExprPtr left, ComparisonOperator op, ExprPtr right, Loc loc = std::nullopt)
    -> ExprPtr;

auto make_if_exp(ExprPtr test, ExprPtr body, ExprPtr orelse, Loc loc = std::nullopt) -> ExprPtr;
auto make_lambda(Arguments args, ExprPtr body, Loc loc = std::nullopt) -> ExprPtr;

auto make_tuple(std::vector<ExprPtr> elements, Loc loc = std::nullopt) -> ExprPtr;
auto make_list(std::vector<ExprPtr> elements, Loc loc = std::nullopt) -> ExprPtr;
auto make_set(std::vector<ExprPtr> elements, Loc loc = std::nullopt) -> ExprPtr;
auto make_dict(std::vector<ExprPtr> keys, std::vector<ExprPtr> values, Loc loc = std::nullopt)
    -> ExprPtr;

auto make_named_expr(ExprPtr target, ExprPtr value, Loc loc = std::nullopt) -> ExprPtr;
auto make_starred(ExprPtr value, Loc loc = std::nullopt) -> ExprPtr;
auto make_emit(std::string value, std::vector<ExprPtr> args, Loc loc = std::nullopt) -> ExprPtr;
auto make_unsupported(std::string construct, Loc loc = std::nullopt) -> ExprPtr;

/// Plain parameter without annotation.
auto make_arg(Identifier name) -> Arg;

// ============================================================================
// Statement Factories
// ============================================================================

auto make_expr_stmt(ExprPtr value, Loc loc = std::nullopt) -> StmtPtr;
auto make_assign(ExprPtr target, ExprPtr value, Loc loc = std::nullopt) -> StmtPtr;
auto make_return(std::optional<ExprPtr> value, Loc loc = std::nullopt) -> StmtPtr;
auto make_if(ExprPtr test, std::vector<StmtPtr> body, std::vector<StmtPtr> orelse,
             Loc loc = std::nullopt) -> StmtPtr;
auto make_while(ExprPtr test, std::vector<StmtPtr> body, Loc loc = std::nullopt) -> StmtPtr;
auto make_for(ExprPtr target, ExprPtr iter, std::vector<StmtPtr> body, Loc loc = std::nullopt)
    -> StmtPtr;
auto make_function_def(Identifier name, Arguments args, std::vector<StmtPtr> body,
                       Loc loc = std::nullopt) -> StmtPtr;
auto make_class_def(Identifier name, std::vector<ExprPtr> bases, std::vector<StmtPtr> body,
                    Loc loc = std::nullopt) -> StmtPtr;
auto make_import(std::vector<Alias> names, Loc loc = std::nullopt) -> StmtPtr;
auto make_import_from(std::optional<Identifier> module, std::vector<Alias> names,
                      Loc loc = std::nullopt) -> StmtPtr;
auto make_raise(std::optional<ExprPtr> exception, Loc loc = std::nullopt) -> StmtPtr;
auto make_pass(Loc loc = std::nullopt) -> StmtPtr;
auto make_break(Loc loc = std::nullopt) -> StmtPtr;
auto make_continue(Loc loc = std::nullopt) -> StmtPtr;

} // namespace pyemit::ast

#endif // PYEMIT_AST_HPP

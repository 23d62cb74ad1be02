//! # Expression AST Nodes
//!
//! Value-producing constructs of the target language.
//!
//! ## Expression Categories
//!
//! - **Atoms**: `Name`, `Constant`
//! - **Operators**: `BinOp`, `UnaryOp`, `BoolOp`, `Compare`
//! - **Access**: `Attribute`, `Subscript`, `Call`
//! - **Displays**: `Tuple`, `List`, `Set`, `Dict`
//! - **Other**: `IfExp`, `Lambda`, `NamedExpr`, `Starred`, `Yield`, `YieldFrom`
//! - **Escape hatch**: `Emit` carries a raw target-language template
//! - **Placeholder**: `Unsupported` marks constructs the printer cannot render
//!
//! Each operator enumerator has exactly one textual rendering, see
//! `printer/print_dispatch.hpp`.

#ifndef PYEMIT_AST_EXPRS_HPP
#define PYEMIT_AST_EXPRS_HPP

#include "pyemit/ast/ast_common.hpp"

#include <variant>

namespace pyemit::ast {

// ============================================================================
// Operators
// ============================================================================

/// Arithmetic and bitwise binary operators.
enum class Operator {
    Add,      ///< `+`
    Sub,      ///< `-`
    Mult,     ///< `*`
    Div,      ///< `/`
    FloorDiv, ///< `//`
    Mod,      ///< `%`
    Pow,      ///< `**`
    LShift,   ///< `<<`
    RShift,   ///< `>>`
    BitOr,    ///< `|`
    BitXor,   ///< `^`
    BitAnd,   ///< `&`
    MatMult,  ///< `@`
};

enum class UnaryOperator {
    Invert, ///< `~x`
    Not,    ///< `not x`
    UAdd,   ///< `+x`
    USub,   ///< `-x`
};

enum class BoolOperator {
    And, ///< `and`
    Or,  ///< `or`
};

enum class ComparisonOperator {
    Eq,    ///< `==`
    NotEq, ///< `!=`
    Lt,    ///< `<`
    LtE,   ///< `<=`
    Gt,    ///< `>`
    GtE,   ///< `>=`
    Is,    ///< `is`
    IsNot, ///< `is not`
    In,    ///< `in`
    NotIn, ///< `not in`
};

// ============================================================================
// Constants
// ============================================================================

/// Numeric constant. The value is stored as a double; integral subkinds only
/// ever hold values representable in 32 bits.
struct NumberValue {
    double value;
    NumberKind kind;

    [[nodiscard]] auto operator==(const NumberValue& other) const -> bool = default;
};

/// The unit / none value.
struct NoneValue {
    [[nodiscard]] auto operator==(const NoneValue&) const -> bool = default;
};

/// Scalar payload of a `Constant`: boolean, string, number or none.
using ConstantValue = std::variant<bool, std::string, NumberValue, NoneValue>;

// ============================================================================
// Function Arguments
// ============================================================================

/// A single parameter: `name` or `name: annotation`.
struct Arg {
    Identifier arg;
    std::optional<ExprPtr> annotation;
};

/// A parameter list.
///
/// `defaults` align with the tail of `posonlyargs` followed by `args`.
struct Arguments {
    std::vector<Arg> posonlyargs;
    std::vector<Arg> args;
    std::optional<Arg> vararg;
    std::vector<ExprPtr> defaults;
    std::optional<Arg> kwarg;
};

/// Keyword argument at a call site: `name=value`, or `**value` without a name.
struct Keyword {
    std::optional<Identifier> arg;
    ExprPtr value;
};

// ============================================================================
// Expression Nodes
// ============================================================================

/// Identifier reference: `foo`.
struct Name {
    Identifier id;
};

/// Literal constant: `42`, `1.5`, `"text"`, `True`, `None`.
struct Constant {
    ConstantValue value;
};

/// Call: `f(a, b, key=c)`.
struct Call {
    ExprPtr func;
    std::vector<ExprPtr> args;
    std::vector<Keyword> keywords;
};

/// Attribute access: `obj.attr`.
struct Attribute {
    ExprPtr value;
    Identifier attr;
};

/// Subscript: `obj[index]`.
struct Subscript {
    ExprPtr value;
    ExprPtr slice;
};

/// Binary arithmetic/bitwise operation: `a + b`.
struct BinOp {
    ExprPtr left;
    Operator op;
    ExprPtr right;
};

/// Unary operation: `-x`, `not x`.
struct UnaryOp {
    UnaryOperator op;
    ExprPtr operand;
};

/// Boolean operation over two or more operands: `a and b and c`.
struct BoolOp {
    BoolOperator op;
    std::vector<ExprPtr> values;
};

/// Comparison chain: `a < b <= c`. `ops` and `comparators` have equal length.
struct Compare {
    ExprPtr left;
    std::vector<ComparisonOperator> ops;
    std::vector<ExprPtr> comparators;
};

/// Conditional expression: `body if test else orelse`.
struct IfExp {
    ExprPtr test;
    ExprPtr body;
    ExprPtr orelse;
};

/// Anonymous function: `lambda x, y: body`.
struct Lambda {
    Arguments args;
    ExprPtr body;
};

struct Tuple {
    std::vector<ExprPtr> elements;
};

struct List {
    std::vector<ExprPtr> elements;
};

struct Set {
    std::vector<ExprPtr> elements;
};

/// Dict display. `keys` and `values` have equal length.
struct Dict {
    std::vector<ExprPtr> keys;
    std::vector<ExprPtr> values;
};

/// Assignment expression: `target := value`.
struct NamedExpr {
    ExprPtr target;
    ExprPtr value;
};

/// Unpacking: `*value`.
struct Starred {
    ExprPtr value;
};

struct Yield {
    std::optional<ExprPtr> value;
};

struct YieldFrom {
    ExprPtr value;
};

/// Raw target-language snippet with `$N` placeholders bound to `args`.
///
/// See `emit/emit_template.hpp` for the placeholder forms.
struct Emit {
    std::string value;
    std::vector<ExprPtr> args;
};

/// A construct the printer does not render yet (e.g. formatted values).
/// Printing one reports a diagnostic and emits `None`.
struct Unsupported {
    std::string construct;
};

/// An expression node.
struct Expr {
    std::variant<Name, Constant, Call, Attribute, Subscript, BinOp, UnaryOp, BoolOp, Compare, IfExp,
                 Lambda, Tuple, List, Set, Dict, NamedExpr, Starred, Yield, YieldFrom, Emit,
                 Unsupported>
        kind;
    std::optional<SourceLocation> loc; ///< Original-source location, if known.

    /// Checks if this expression is of kind `T`.
    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    /// Gets this expression as kind `T`. Throws `std::bad_variant_access` if wrong kind.
    template <typename T> [[nodiscard]] auto as() -> T& {
        return std::get<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

} // namespace pyemit::ast

#endif // PYEMIT_AST_EXPRS_HPP

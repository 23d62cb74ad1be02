//! # Type-Directed Expression Builder
//!
//! Synthesizes AST fragments for values and runtime checks the target
//! language cannot express directly.
//!
//! ## Literal Construction
//!
//! | Type            | Value                 | Result                                   |
//! |-----------------|-----------------------|------------------------------------------|
//! | int64 / uint64  | `int64_t`/`uint64_t`  | `long.from_bits(low, high, unsigned)`    |
//! | decimal         | `DecimalValue`        | float64 constant (precision may be lost) |
//! | float32         | `float`               | `util.fround(x)`                         |
//! | enum `E`        | 8/16/32-bit integer   | `E(x)`                                   |
//! | `T[]` (numeric) | byte/ushort buffer    | `[x0, x1, ...]`                          |
//! | unit            | anything              | `None`                                   |
//!
//! Scalars map to constants only when the value type matches the semantic
//! type exactly. Any other pairing is reported as P003.
//!
//! ## Runtime Type Tests
//!
//! | Type                          | Test                                     |
//! |-------------------------------|------------------------------------------|
//! | any                           | `True`                                   |
//! | unit                          | `x is None`                              |
//! | bool/char/string/number/enum  | `util.type_of(x) == "..."`               |
//! | function                      | `util.type_of(x) == "function"`          |
//! | regex                         | `isinstance(x, re.Pattern)`              |
//! | int64/uint64/decimal/bigint   | `isinstance(x, <runtime class>)`         |
//! | array/tuple/list              | `util.is_array_like(x)`                  |
//! | declared record/union/class   | P001, `None`                             |
//! | option/generic/erased union   | P002, `None`                             |
//!
//! Every failure goes through the `DiagnosticSink`; the returned placeholder
//! keeps the surrounding unit printable.

#ifndef PYEMIT_BUILDER_EXPR_BUILDER_HPP
#define PYEMIT_BUILDER_EXPR_BUILDER_HPP

#include "pyemit/ast/ast.hpp"
#include "pyemit/diag/diagnostics.hpp"
#include "pyemit/types/type.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace pyemit::builder {

/// Names of the runtime helpers referenced by built expressions.
struct RuntimeNames {
    std::string long_module = "long";
    std::string long_class = "Long";
    std::string long_from_bits = "from_bits";
    std::string decimal_module = "decimal";
    std::string decimal_class = "Decimal";
    std::string big_int_module = "big_int";
    std::string big_int_class = "BigInteger";
    std::string regex_module = "re";
    std::string regex_class = "Pattern";
    std::string util_module = "util";
    std::string type_of = "type_of";
    std::string is_array_like = "is_array_like";
    std::string fround = "fround";
    std::string isinstance = "isinstance";
};

/// Decimal literal kept as its source text.
struct DecimalValue {
    std::string text;
};

/// A literal as the front end hands it over.
using LiteralValue =
    std::variant<std::monostate, bool, std::string, char32_t, int8_t, uint8_t, int16_t, uint16_t,
                 int32_t, uint32_t, int64_t, uint64_t, float, double, DecimalValue,
                 std::vector<uint8_t>, std::vector<uint16_t>>;

/// Short name of the value's runtime type, for diagnostics.
[[nodiscard]] auto literal_kind_name(const LiteralValue& value) -> const char*;

class ExprBuilder {
public:
    explicit ExprBuilder(diag::DiagnosticSink& diagnostics, RuntimeNames names = {});

    /// Literal or constructor call for `value` typed as `type`.
    auto make_type_const(const types::Type& type, const LiteralValue& value,
                         ast::Loc loc = std::nullopt) -> ast::ExprPtr;

    /// Boolean expression checking at runtime that `expr` has type `type`.
    auto make_type_test(const types::Type& type, ast::ExprPtr expr, ast::Loc loc = std::nullopt)
        -> ast::ExprPtr;

    /// `module.member`
    auto make_core_ref(const std::string& module, const std::string& member,
                       ast::Loc loc = std::nullopt) -> ast::ExprPtr;

    /// `module.member(args...)`
    auto make_core_call(const std::string& module, const std::string& member,
                        std::vector<ast::ExprPtr> args, ast::Loc loc = std::nullopt)
        -> ast::ExprPtr;

    /// `long.from_bits(low, high, unsigned)`
    auto make_long(uint64_t bits, bool is_unsigned, ast::Loc loc = std::nullopt) -> ast::ExprPtr;

    /// `util.fround(x)`
    auto make_float32(float value, ast::Loc loc = std::nullopt) -> ast::ExprPtr;

    [[nodiscard]] auto names() const -> const RuntimeNames& {
        return names_;
    }

private:
    diag::DiagnosticSink& diagnostics_;
    RuntimeNames names_;

    auto make_enum_const(const types::EnumType& type, const LiteralValue& value, ast::Loc loc)
        -> ast::ExprPtr;
    auto make_array_const(const types::ArrayType& type, const LiteralValue& value, ast::Loc loc)
        -> ast::ExprPtr;
    auto mismatch(const types::Type& type, const LiteralValue& value, ast::Loc loc)
        -> ast::ExprPtr;

    auto type_of_test(ast::ExprPtr expr, const char* primitive, ast::Loc loc) -> ast::ExprPtr;
    auto instance_test(ast::ExprPtr expr, ast::ExprPtr cls, ast::Loc loc) -> ast::ExprPtr;
};

} // namespace pyemit::builder

#endif // PYEMIT_BUILDER_EXPR_BUILDER_HPP

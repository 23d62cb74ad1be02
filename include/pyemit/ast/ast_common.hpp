//! # Target AST Common Types
//!
//! Forward declarations, owning pointer aliases and location metadata shared
//! by the target-language AST headers.
//!
//! ## Architecture
//!
//! - `ast_common.hpp` - Forward declarations, locations, literal kinds (this file)
//! - `ast_exprs.hpp` - Expressions and operators
//! - `ast_stmts.hpp` - Statements and the `Module` root
//! - `ast.hpp` - Main header plus factory functions
//!
//! ## Ownership Model
//!
//! Every child node is owned through `Box<T>`. The tree is built once by the
//! front end (or the expression builder), then only read: all consumers take
//! nodes by `const&`.

#ifndef PYEMIT_AST_COMMON_HPP
#define PYEMIT_AST_COMMON_HPP

#include "pyemit/common.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pyemit::ast {

struct Expr;
struct Stmt;

using ExprPtr = Box<Expr>;
using StmtPtr = Box<Stmt>;

/// A target-language identifier token. The front end guarantees it is
/// non-empty and already valid in the target grammar.
using Identifier = std::string;

// ============================================================================
// Source Locations
// ============================================================================

/// A position in the original source file. Lines are 1-based, columns 0-based.
struct Position {
    uint32_t line = 1;
    uint32_t column = 0;

    [[nodiscard]] auto operator==(const Position& other) const -> bool = default;
};

/// Original-source range of a node, used only for source-map correlation.
struct SourceLocation {
    Position start;
    Position end;
    std::optional<std::string> identifier_name; ///< Original name, if the node renames one.

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

// ============================================================================
// Literal Kinds
// ============================================================================

/// Numeric subkind carried by numeric constants.
enum class NumberKind {
    Int8,
    UInt8,
    Int16,
    UInt16,
    Int32,
    UInt32,
    Float32,
    Float64,
};

/// Returns true for the integral subkinds.
[[nodiscard]] constexpr auto is_integral(NumberKind kind) -> bool {
    return kind != NumberKind::Float32 && kind != NumberKind::Float64;
}

} // namespace pyemit::ast

#endif // PYEMIT_AST_COMMON_HPP

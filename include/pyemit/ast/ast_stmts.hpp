//! # Statement AST Nodes
//!
//! Statements of the target language and the `Module` root.
//!
//! ## Statement Categories
//!
//! - **Definitions**: `FunctionDef`, `ClassDef`
//! - **Control flow**: `If`, `For`, `While`, `Try`
//! - **Imports**: `Import`, `ImportFrom`
//! - **Simple**: `Assign`, `Return`, `Raise`, `ExprStmt`, `Pass`, `Break`,
//!   `Continue`, `Global`, `NonLocal`
//!
//! ## Else Chains
//!
//! An `elif` is not a separate node. It is an `If` whose `orelse` holds exactly
//! one `If`; the printer folds that shape back into `elif`:
//!
//! ```text
//! If(A, body1, [If(B, body2, body3)])   =>   if A: ... elif B: ... else: ...
//! ```

#ifndef PYEMIT_AST_STMTS_HPP
#define PYEMIT_AST_STMTS_HPP

#include "pyemit/ast/ast_common.hpp"
#include "pyemit/ast/ast_exprs.hpp"

namespace pyemit::ast {

// ============================================================================
// Helpers
// ============================================================================

/// One imported name: `name` or `name as asname`.
struct Alias {
    Identifier name;
    std::optional<Identifier> asname;
};

/// One `except` clause of a `Try`.
struct ExceptHandler {
    std::optional<ExprPtr> type;    ///< Exception class; absent for a bare `except:`.
    std::optional<Identifier> name; ///< Binding introduced by `as name`.
    std::vector<StmtPtr> body;
    std::optional<SourceLocation> loc;
};

// ============================================================================
// Definitions
// ============================================================================

/// Function definition.
///
/// ```text
/// @decorator
/// async def name(a, b: int = 1, *rest, **kw) -> int:
///     body
/// ```
struct FunctionDef {
    Identifier name;
    Arguments args;
    std::vector<StmtPtr> body;
    std::vector<ExprPtr> decorator_list;
    std::optional<ExprPtr> returns; ///< Return annotation.
    bool is_async = false;
};

/// Class definition: `class Name(Base1, Base2):`.
struct ClassDef {
    Identifier name;
    std::vector<ExprPtr> bases;
    std::vector<StmtPtr> body;
    std::vector<ExprPtr> decorator_list;
};

// ============================================================================
// Control Flow
// ============================================================================

struct If {
    ExprPtr test;
    std::vector<StmtPtr> body;
    std::vector<StmtPtr> orelse;
};

/// `for target in iter:` with an optional `else:` block.
struct For {
    ExprPtr target;
    ExprPtr iter;
    std::vector<StmtPtr> body;
    std::vector<StmtPtr> orelse;
    bool is_async = false;
};

struct While {
    ExprPtr test;
    std::vector<StmtPtr> body;
    std::vector<StmtPtr> orelse;
};

/// `try:` / `except:` / `else:` / `finally:`.
struct Try {
    std::vector<StmtPtr> body;
    std::vector<ExceptHandler> handlers;
    std::vector<StmtPtr> orelse;
    std::vector<StmtPtr> finalbody;
};

// ============================================================================
// Imports
// ============================================================================

/// `import a` or `import (a, b as c)`.
struct Import {
    std::vector<Alias> names;
};

/// `from module import a, b`. The module is passed through the output sink's
/// import-path hook before printing.
struct ImportFrom {
    std::optional<Identifier> module; ///< Absent means the current package (`.`).
    std::vector<Alias> names;
};

// ============================================================================
// Simple Statements
// ============================================================================

/// `t1 = t2 = value`.
struct Assign {
    std::vector<ExprPtr> targets;
    ExprPtr value;
};

struct Return {
    std::optional<ExprPtr> value;
};

/// `raise`, `raise exc`, or `raise exc from cause`.
struct Raise {
    std::optional<ExprPtr> exception;
    std::optional<ExprPtr> cause;
};

/// An expression evaluated for its side effects.
struct ExprStmt {
    ExprPtr value;
};

struct Pass {};
struct Break {};
struct Continue {};

struct Global {
    std::vector<Identifier> names;
};

struct NonLocal {
    std::vector<Identifier> names;
};

/// A statement node.
struct Stmt {
    std::variant<FunctionDef, ClassDef, If, For, While, Try, Import, ImportFrom, Assign, Return,
                 Raise, ExprStmt, Pass, Break, Continue, Global, NonLocal>
        kind;
    std::optional<SourceLocation> loc;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() -> T& {
        return std::get<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

/// The root of one compilation unit.
struct Module {
    std::vector<StmtPtr> body;
};

} // namespace pyemit::ast

#endif // PYEMIT_AST_STMTS_HPP

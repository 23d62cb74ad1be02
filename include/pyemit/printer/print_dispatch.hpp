//! # Print Dispatch
//!
//! Turns AST nodes into `Printer` calls. One case per statement, expression
//! and operator variant; every `std::visit` ends in a `static_assert`, so a new
//! AST variant fails to compile until it is handled here.
//!
//! ## Parenthesization
//!
//! Operands of binary, unary, boolean and comparison operators are wrapped in
//! parentheses unless they are a constant or a name. This over-parenthesizes
//! (`(f(x)) + 1`) but never changes grouping. Receivers of attribute access,
//! subscripts and calls are wrapped unless they already bind tighter than a
//! postfix operator.
//!
//! ## Layout
//!
//! | Construct      | Output                                              |
//! |----------------|-----------------------------------------------------|
//! | block          | `:` newline, indented statements, trailing newline  |
//! | empty block    | `pass`                                              |
//! | else `[If]`    | folded into `elif`                                  |
//! | else `[]`/`[Pass]` | omitted                                         |
//! | 1-tuple        | `(x,)`                                              |
//! | dict           | one `key: value` pair per line, no trailing comma   |
//! | import of 2+   | `import (a, b)`                                     |
//!
//! ## Source Locations
//!
//! A located node's mapping is recorded at the first character it prints,
//! which may belong to a child (`a` in `a + b`). Locations are queued until
//! the next non-empty text and drained at every newline.

#ifndef PYEMIT_PRINTER_PRINT_DISPATCH_HPP
#define PYEMIT_PRINTER_PRINT_DISPATCH_HPP

#include "pyemit/ast/ast.hpp"
#include "pyemit/diag/diagnostics.hpp"
#include "pyemit/emit/emit_template.hpp"
#include "pyemit/printer/printer.hpp"

#include <string_view>
#include <vector>

namespace pyemit::printer {

// ============================================================================
// Operator Spellings
// ============================================================================

/// Binary operator with surrounding spaces: `" + "`.
[[nodiscard]] auto operator_str(ast::Operator op) -> const char*;

/// Unary operator prefix: `"-"`, `"not "`.
[[nodiscard]] auto unary_operator_str(ast::UnaryOperator op) -> const char*;

/// `" and "` / `" or "`.
[[nodiscard]] auto bool_operator_str(ast::BoolOperator op) -> const char*;

/// Comparison with surrounding spaces: `" is not "`.
[[nodiscard]] auto comparison_operator_str(ast::ComparisonOperator op) -> const char*;

// ============================================================================
// PrintDispatch
// ============================================================================

class EmitOutput;

/// Prints AST nodes of one compilation unit into a `Printer`.
///
/// Unsupported constructs are reported to the diagnostic sink; under
/// `FailurePolicy::Abort` that throws out of the print call.
class PrintDispatch {
public:
    PrintDispatch(Printer& printer, diag::DiagnosticSink& diagnostics);

    void print_stmt(const ast::Stmt& stmt);

    /// Prints each statement followed by a newline if the line is not empty.
    void print_statements(const std::vector<ast::StmtPtr>& stmts);

    void print_expr(const ast::Expr& expr);

    /// Prints `expr`, parenthesized unless it is a constant, a name or a
    /// named expression (which brings its own parentheses).
    void print_operand(const ast::Expr& expr);

    /// `:`-terminated header already printed; prints the indented body.
    void print_block(const std::vector<ast::StmtPtr>& body, bool skip_newline_at_end = false);

    /// Records locations still waiting for text, then ends the line.
    void newline();

    /// Ends the line unless nothing has been printed on it.
    void separator();

    /// Records locations still waiting for text. Called at declaration ends.
    void flush_locations();

    [[nodiscard]] auto templates() const -> const emit::TemplateCache& {
        return templates_;
    }

private:
    friend class EmitOutput;

    Printer& printer_;
    diag::DiagnosticSink& diagnostics_;
    emit::TemplateCache templates_;
    std::vector<ast::SourceLocation> pending_;

    void text(std::string_view s);
    void mark(const std::optional<ast::SourceLocation>& loc);
    void print_suite(const std::vector<ast::StmtPtr>& body);

    // Statements (print_stmt.cpp)
    void print_function_def(const ast::FunctionDef& func);
    void print_class_def(const ast::ClassDef& cls);
    void print_decorators(const std::vector<ast::ExprPtr>& decorators);
    void print_indented(const std::vector<ast::StmtPtr>& body);
    void print_if(const ast::If& node);
    void print_else(const std::vector<ast::StmtPtr>& orelse);
    void print_for(const ast::For& node);
    void print_while(const ast::While& node);
    void print_loop_else(const std::vector<ast::StmtPtr>& orelse);
    void print_try(const ast::Try& node);
    void print_handler(const ast::ExceptHandler& handler);
    void print_import(const ast::Import& node);
    void print_import_from(const ast::ImportFrom& node);
    void print_aliases(const std::vector<ast::Alias>& names);
    void print_assign(const ast::Assign& node);
    void print_return(const ast::Return& node);
    void print_raise(const ast::Raise& node);
    void print_names(const char* keyword, const std::vector<ast::Identifier>& names);

    // Expressions (print_expr.cpp)
    void print_receiver(const ast::Expr& expr);
    void print_comma_separated(const std::vector<ast::ExprPtr>& exprs);
    void print_call(const ast::Call& node);
    void print_bin_op(const ast::BinOp& node);
    void print_bool_op(const ast::BoolOp& node);
    void print_compare(const ast::Compare& node);
    void print_if_exp(const ast::IfExp& node);
    void print_lambda(const ast::Lambda& node);
    void print_arguments(const ast::Arguments& args);
    void print_arg(const ast::Arg& arg);
    void print_tuple(const ast::Tuple& node);
    void print_set(const ast::Set& node);
    void print_dict(const ast::Dict& node);
    void print_emit(const ast::Emit& node);
    void print_unsupported(const ast::Unsupported& node,
                           const std::optional<ast::SourceLocation>& loc);
};

} // namespace pyemit::printer

#endif // PYEMIT_PRINTER_PRINT_DISPATCH_HPP

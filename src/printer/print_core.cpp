//! # Print Dispatch Core
//!
//! | Method              | Description                                    |
//! |---------------------|------------------------------------------------|
//! | `text()`            | Print, attaching queued locations              |
//! | `newline()`         | Drain queued locations, end the line           |
//! | `separator()`       | Newline only if the line has content           |
//! | `print_block()`     | Indented statement list                        |
//! | `print_suite()`     | Statements, or `pass` if none printed anything |
//! | `print_operand()`   | Conservative parenthesization                  |
//! | `operator_str()`    | Operator spellings                             |

#include "pyemit/printer/print_dispatch.hpp"

#include <cmath>

namespace pyemit::printer {

auto operator_str(ast::Operator op) -> const char* {
    switch (op) {
    case ast::Operator::Add:
        return " + ";
    case ast::Operator::Sub:
        return " - ";
    case ast::Operator::Mult:
        return " * ";
    case ast::Operator::Div:
        return " / ";
    case ast::Operator::FloorDiv:
        return " // ";
    case ast::Operator::Mod:
        return " % ";
    case ast::Operator::Pow:
        return " ** ";
    case ast::Operator::LShift:
        return " << ";
    case ast::Operator::RShift:
        return " >> ";
    case ast::Operator::BitOr:
        return " | ";
    case ast::Operator::BitXor:
        return " ^ ";
    case ast::Operator::BitAnd:
        return " & ";
    case ast::Operator::MatMult:
        return " @ ";
    }
    return " ? ";
}

auto unary_operator_str(ast::UnaryOperator op) -> const char* {
    switch (op) {
    case ast::UnaryOperator::Invert:
        return "~";
    case ast::UnaryOperator::Not:
        return "not ";
    case ast::UnaryOperator::UAdd:
        return "+";
    case ast::UnaryOperator::USub:
        return "-";
    }
    return "?";
}

auto bool_operator_str(ast::BoolOperator op) -> const char* {
    switch (op) {
    case ast::BoolOperator::And:
        return " and ";
    case ast::BoolOperator::Or:
        return " or ";
    }
    return " ? ";
}

auto comparison_operator_str(ast::ComparisonOperator op) -> const char* {
    switch (op) {
    case ast::ComparisonOperator::Eq:
        return " == ";
    case ast::ComparisonOperator::NotEq:
        return " != ";
    case ast::ComparisonOperator::Lt:
        return " < ";
    case ast::ComparisonOperator::LtE:
        return " <= ";
    case ast::ComparisonOperator::Gt:
        return " > ";
    case ast::ComparisonOperator::GtE:
        return " >= ";
    case ast::ComparisonOperator::Is:
        return " is ";
    case ast::ComparisonOperator::IsNot:
        return " is not ";
    case ast::ComparisonOperator::In:
        return " in ";
    case ast::ComparisonOperator::NotIn:
        return " not in ";
    }
    return " ? ";
}

PrintDispatch::PrintDispatch(Printer& printer, diag::DiagnosticSink& diagnostics)
    : printer_(printer), diagnostics_(diagnostics) {}

void PrintDispatch::text(std::string_view s) {
    if (s.empty())
        return;

    // Every queued node starts at this character.
    for (const auto& loc : pending_) {
        printer_.print("", loc);
    }
    pending_.clear();

    printer_.print(s);
}

void PrintDispatch::newline() {
    flush_locations();
    printer_.newline();
}

void PrintDispatch::separator() {
    if (printer_.column() > 0) {
        newline();
    }
}

void PrintDispatch::mark(const std::optional<ast::SourceLocation>& loc) {
    if (loc) {
        pending_.push_back(*loc);
    }
}

void PrintDispatch::flush_locations() {
    for (const auto& loc : pending_) {
        printer_.add_location(loc);
    }
    pending_.clear();
}

void PrintDispatch::print_block(const std::vector<ast::StmtPtr>& body, bool skip_newline_at_end) {
    printer_.print("");
    newline();
    printer_.push_indent();
    print_suite(body);
    printer_.pop_indent();

    if (!skip_newline_at_end) {
        newline();
    }
}

void PrintDispatch::print_statements(const std::vector<ast::StmtPtr>& stmts) {
    for (const auto& stmt : stmts) {
        print_stmt(*stmt);
        separator();
    }
}

void PrintDispatch::print_suite(const std::vector<ast::StmtPtr>& body) {
    // Starts on a fresh line; `global` with no names, an empty import or an
    // empty emit leave it untouched.
    uint32_t line = printer_.line();
    print_statements(body);
    if (printer_.line() == line && printer_.column() == 0) {
        text("pass");
        separator();
    }
}

void PrintDispatch::print_operand(const ast::Expr& expr) {
    bool bare = expr.is<ast::Name>() || expr.is<ast::NamedExpr>();
    if (expr.is<ast::Constant>()) {
        // `-1 ** 2` would group as `-(1 ** 2)`.
        const auto* number = std::get_if<ast::NumberValue>(&expr.as<ast::Constant>().value);
        bare = number == nullptr || !std::signbit(number->value);
    }
    if (bare) {
        print_expr(expr);
        return;
    }
    text("(");
    print_expr(expr);
    text(")");
}

} // namespace pyemit::printer

//! # Expression Printing
//!
//! | Expression        | Output                                            |
//! |-------------------|---------------------------------------------------|
//! | `Call`            | `f(a, b, key=c, **kw)`                            |
//! | `Attribute`       | `obj.attr`, `(a + b).attr`                        |
//! | `BinOp`           | `a + (b * c)`                                     |
//! | `IfExp`           | `a if (test) else (b)`                            |
//! | `Lambda`          | `lambda x, y: body`                               |
//! | `NamedExpr`       | `(y := f(x))`                                     |
//! | `Tuple`           | `()`, `(x,)`, `(x, y)`                            |
//! | `Set`             | `{a, b}`, `set()`                                 |
//! | `Dict`            | `{}` or one pair per line                         |
//! | `Emit`            | template with arguments substituted               |
//! | `Unsupported`     | diagnostic P005, then `None`                      |

#include "pyemit/printer/print_dispatch.hpp"

#include "pyemit/log/log.hpp"
#include "pyemit/printer/literals.hpp"

#include <algorithm>

namespace pyemit::printer {

/// Feeds a rendered emit template back through the dispatch.
class EmitOutput : public emit::TemplateOutput {
public:
    EmitOutput(PrintDispatch& dispatch, const std::vector<ast::ExprPtr>& args)
        : dispatch_(dispatch), args_(args) {}

    auto column() const -> uint32_t override {
        return dispatch_.printer_.column();
    }

    void text(std::string_view s) override {
        dispatch_.text(s);
    }

    void newline() override {
        dispatch_.newline();
    }

    void argument(size_t index) override {
        dispatch_.print_operand(*args_[index]);
    }

private:
    PrintDispatch& dispatch_;
    const std::vector<ast::ExprPtr>& args_;
};

void PrintDispatch::print_expr(const ast::Expr& expr) {
    mark(expr.loc);

    std::visit(
        [this, &expr](const auto& node) {
            using T = std::decay_t<decltype(node)>;

            if constexpr (std::is_same_v<T, ast::Name>) {
                text(node.id);
            } else if constexpr (std::is_same_v<T, ast::Constant>) {
                text(format_constant(node.value));
            } else if constexpr (std::is_same_v<T, ast::Call>) {
                print_call(node);
            } else if constexpr (std::is_same_v<T, ast::Attribute>) {
                print_receiver(*node.value);
                text(".");
                text(node.attr);
            } else if constexpr (std::is_same_v<T, ast::Subscript>) {
                print_receiver(*node.value);
                text("[");
                print_expr(*node.slice);
                text("]");
            } else if constexpr (std::is_same_v<T, ast::BinOp>) {
                print_bin_op(node);
            } else if constexpr (std::is_same_v<T, ast::UnaryOp>) {
                text(unary_operator_str(node.op));
                print_operand(*node.operand);
            } else if constexpr (std::is_same_v<T, ast::BoolOp>) {
                print_bool_op(node);
            } else if constexpr (std::is_same_v<T, ast::Compare>) {
                print_compare(node);
            } else if constexpr (std::is_same_v<T, ast::IfExp>) {
                print_if_exp(node);
            } else if constexpr (std::is_same_v<T, ast::Lambda>) {
                print_lambda(node);
            } else if constexpr (std::is_same_v<T, ast::Tuple>) {
                print_tuple(node);
            } else if constexpr (std::is_same_v<T, ast::List>) {
                text("[");
                print_comma_separated(node.elements);
                text("]");
            } else if constexpr (std::is_same_v<T, ast::Set>) {
                print_set(node);
            } else if constexpr (std::is_same_v<T, ast::Dict>) {
                print_dict(node);
            } else if constexpr (std::is_same_v<T, ast::NamedExpr>) {
                // A bare `:=` is only valid nested inside another construct.
                text("(");
                print_expr(*node.target);
                text(" := ");
                print_expr(*node.value);
                text(")");
            } else if constexpr (std::is_same_v<T, ast::Starred>) {
                text("*");
                print_operand(*node.value);
            } else if constexpr (std::is_same_v<T, ast::Yield>) {
                text("yield");
                if (node.value) {
                    text(" ");
                    print_expr(**node.value);
                }
            } else if constexpr (std::is_same_v<T, ast::YieldFrom>) {
                text("yield from ");
                print_expr(*node.value);
            } else if constexpr (std::is_same_v<T, ast::Emit>) {
                print_emit(node);
            } else if constexpr (std::is_same_v<T, ast::Unsupported>) {
                print_unsupported(node, expr.loc);
            } else {
                static_assert(always_false_v<T>, "unhandled expression kind");
            }
        },
        expr.kind);
}

void PrintDispatch::print_comma_separated(const std::vector<ast::ExprPtr>& exprs) {
    for (size_t i = 0; i < exprs.size(); ++i) {
        if (i > 0)
            text(", ");
        print_expr(*exprs[i]);
    }
}

/// Left side of `.attr`, `[index]` and `(args)`.
void PrintDispatch::print_receiver(const ast::Expr& expr) {
    bool bare = std::visit(
        [](const auto& node) -> bool {
            using T = std::decay_t<decltype(node)>;

            if constexpr (std::is_same_v<T, ast::Constant>) {
                // `1.real` does not parse.
                return !std::holds_alternative<ast::NumberValue>(node.value);
            } else {
                return std::is_same_v<T, ast::Name> || std::is_same_v<T, ast::Call> ||
                       std::is_same_v<T, ast::Attribute> || std::is_same_v<T, ast::Subscript> ||
                       std::is_same_v<T, ast::Tuple> || std::is_same_v<T, ast::List> ||
                       std::is_same_v<T, ast::Set> || std::is_same_v<T, ast::Dict> ||
                       std::is_same_v<T, ast::NamedExpr>;
            }
        },
        expr.kind);

    if (bare) {
        print_expr(expr);
        return;
    }
    text("(");
    print_expr(expr);
    text(")");
}

void PrintDispatch::print_call(const ast::Call& node) {
    print_receiver(*node.func);
    text("(");
    print_comma_separated(node.args);

    for (size_t i = 0; i < node.keywords.size(); ++i) {
        if (i > 0 || !node.args.empty())
            text(", ");
        const auto& kw = node.keywords[i];
        if (kw.arg) {
            text(*kw.arg);
            text("=");
        } else {
            text("**");
        }
        print_expr(*kw.value);
    }
    text(")");
}

// ============================================================================
// Operators
// ============================================================================

void PrintDispatch::print_bin_op(const ast::BinOp& node) {
    print_operand(*node.left);
    text(operator_str(node.op));
    print_operand(*node.right);
}

void PrintDispatch::print_bool_op(const ast::BoolOp& node) {
    for (size_t i = 0; i < node.values.size(); ++i) {
        if (i > 0)
            text(bool_operator_str(node.op));
        print_operand(*node.values[i]);
    }
}

void PrintDispatch::print_compare(const ast::Compare& node) {
    print_operand(*node.left);
    size_t count = std::min(node.ops.size(), node.comparators.size());
    for (size_t i = 0; i < count; ++i) {
        text(comparison_operator_str(node.ops[i]));
        print_operand(*node.comparators[i]);
    }
}

void PrintDispatch::print_if_exp(const ast::IfExp& node) {
    print_operand(*node.body);
    text(" if (");
    print_expr(*node.test);
    text(") else (");
    print_expr(*node.orelse);
    text(")");
}

// ============================================================================
// Functions
// ============================================================================

void PrintDispatch::print_arg(const ast::Arg& arg) {
    text(arg.arg);
    if (arg.annotation) {
        text(": ");
        print_expr(**arg.annotation);
    }
}

void PrintDispatch::print_arguments(const ast::Arguments& args) {
    size_t posonly = args.posonlyargs.size();
    size_t total = posonly + args.args.size();
    size_t first_default = total - std::min(args.defaults.size(), total);

    for (size_t i = 0; i < total; ++i) {
        if (i > 0)
            text(", ");
        print_arg(i < posonly ? args.posonlyargs[i] : args.args[i - posonly]);
        if (i >= first_default) {
            text("=");
            print_expr(*args.defaults[i - first_default]);
        }
        if (i + 1 == posonly)
            text(", /");
    }

    if (args.vararg) {
        if (total > 0)
            text(", ");
        text("*");
        print_arg(*args.vararg);
    }

    if (args.kwarg) {
        if (total > 0 || args.vararg)
            text(", ");
        text("**");
        print_arg(*args.kwarg);
    }
}

void PrintDispatch::print_lambda(const ast::Lambda& node) {
    text("lambda");
    const auto& a = node.args;
    if (!a.posonlyargs.empty() || !a.args.empty() || a.vararg || a.kwarg) {
        text(" ");
        print_arguments(a);
    }
    text(": ");
    print_expr(*node.body);
}

// ============================================================================
// Displays
// ============================================================================

void PrintDispatch::print_tuple(const ast::Tuple& node) {
    text("(");
    print_comma_separated(node.elements);
    if (node.elements.size() == 1)
        text(",");
    text(")");
}

void PrintDispatch::print_set(const ast::Set& node) {
    // `{}` is an empty dict.
    if (node.elements.empty()) {
        text("set()");
        return;
    }
    text("{");
    print_comma_separated(node.elements);
    text("}");
}

void PrintDispatch::print_dict(const ast::Dict& node) {
    size_t count = std::min(node.keys.size(), node.values.size());
    if (count == 0) {
        text("{}");
        return;
    }

    text("{");
    newline();
    printer_.push_indent();

    for (size_t i = 0; i < count; ++i) {
        print_expr(*node.keys[i]);
        text(": ");
        print_expr(*node.values[i]);
        if (i + 1 < count) {
            text(",");
            newline();
        }
    }

    newline();
    printer_.pop_indent();
    text("}");
}

// ============================================================================
// Escape Hatches
// ============================================================================

void PrintDispatch::print_emit(const ast::Emit& node) {
    std::vector<bool> constant_args;
    constant_args.reserve(node.args.size());
    for (const auto& arg : node.args) {
        constant_args.push_back(arg->is<ast::Constant>());
    }

    const auto& compiled = templates_.get(node.value, constant_args);
    EmitOutput out(*this, node.args);
    emit::render(compiled, node.args.size(), out);
}

void PrintDispatch::print_unsupported(const ast::Unsupported& node,
                                      const std::optional<ast::SourceLocation>& loc) {
    PYEMIT_LOG_DEBUG("printer", "Unsupported construct: " << node.construct);
    diagnostics_.unsupported(diag::codes::UNSUPPORTED_NODE,
                             "cannot print " + node.construct + " yet", loc);
    text("None");
}

} // namespace pyemit::printer

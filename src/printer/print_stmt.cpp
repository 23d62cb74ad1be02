//! # Statement Printing
//!
//! | Statement      | Output                                              |
//! |----------------|-----------------------------------------------------|
//! | `FunctionDef`  | decorators, `def name(args) -> ret:` + block        |
//! | `ClassDef`     | decorators, `class Name(bases):` + body             |
//! | `If`           | `if`, folded `elif`s, `else:` unless trivially empty |
//! | `For`/`While`  | header + body, optional `else:`                     |
//! | `Try`          | `try:`, `except T as e:`, `else:`, `finally:`       |
//! | `Import`       | `import a` / `import (a, b as c)`                   |
//! | `ImportFrom`   | `from <hooked path> import ...`                     |
//! | simple         | `x = y`, `return`, `raise e from c`, `pass`, ...    |

#include "pyemit/printer/print_dispatch.hpp"

namespace pyemit::printer {

void PrintDispatch::print_stmt(const ast::Stmt& stmt) {
    mark(stmt.loc);

    std::visit(
        [this](const auto& node) {
            using T = std::decay_t<decltype(node)>;

            if constexpr (std::is_same_v<T, ast::FunctionDef>) {
                print_function_def(node);
            } else if constexpr (std::is_same_v<T, ast::ClassDef>) {
                print_class_def(node);
            } else if constexpr (std::is_same_v<T, ast::If>) {
                print_if(node);
            } else if constexpr (std::is_same_v<T, ast::For>) {
                print_for(node);
            } else if constexpr (std::is_same_v<T, ast::While>) {
                print_while(node);
            } else if constexpr (std::is_same_v<T, ast::Try>) {
                print_try(node);
            } else if constexpr (std::is_same_v<T, ast::Import>) {
                print_import(node);
            } else if constexpr (std::is_same_v<T, ast::ImportFrom>) {
                print_import_from(node);
            } else if constexpr (std::is_same_v<T, ast::Assign>) {
                print_assign(node);
            } else if constexpr (std::is_same_v<T, ast::Return>) {
                print_return(node);
            } else if constexpr (std::is_same_v<T, ast::Raise>) {
                print_raise(node);
            } else if constexpr (std::is_same_v<T, ast::ExprStmt>) {
                print_expr(*node.value);
            } else if constexpr (std::is_same_v<T, ast::Pass>) {
                text("pass");
            } else if constexpr (std::is_same_v<T, ast::Break>) {
                text("break");
            } else if constexpr (std::is_same_v<T, ast::Continue>) {
                text("continue");
            } else if constexpr (std::is_same_v<T, ast::Global>) {
                print_names("global ", node.names);
            } else if constexpr (std::is_same_v<T, ast::NonLocal>) {
                print_names("nonlocal ", node.names);
            } else {
                static_assert(always_false_v<T>, "unhandled statement kind");
            }
        },
        stmt.kind);
}

// ============================================================================
// Definitions
// ============================================================================

void PrintDispatch::print_decorators(const std::vector<ast::ExprPtr>& decorators) {
    for (const auto& deco : decorators) {
        text("@");
        print_expr(*deco);
        newline();
    }
}

void PrintDispatch::print_function_def(const ast::FunctionDef& func) {
    print_decorators(func.decorator_list);

    text(func.is_async ? "async def " : "def ");
    text(func.name);
    text("(");
    print_arguments(func.args);
    text(")");
    if (func.returns) {
        text(" -> ");
        print_expr(**func.returns);
    }
    text(":");
    print_block(func.body, true);
    newline();
}

/// Header already printed, without the colon's newline.
void PrintDispatch::print_indented(const std::vector<ast::StmtPtr>& body) {
    newline();
    printer_.push_indent();
    print_suite(body);
    printer_.pop_indent();
}

void PrintDispatch::print_class_def(const ast::ClassDef& cls) {
    print_decorators(cls.decorator_list);

    text("class ");
    text(cls.name);
    if (!cls.bases.empty()) {
        text("(");
        print_comma_separated(cls.bases);
        text(")");
    }
    text(":");
    print_indented(cls.body);
}

// ============================================================================
// Control Flow
// ============================================================================

void PrintDispatch::print_if(const ast::If& node) {
    text("if ");
    print_expr(*node.test);
    text(":");
    print_block(node.body);
    print_else(node.orelse);
}

void PrintDispatch::print_else(const std::vector<ast::StmtPtr>& orelse) {
    if (orelse.empty())
        return;
    if (orelse.size() == 1 && orelse[0]->is<ast::Pass>())
        return;

    if (orelse.size() == 1 && orelse[0]->is<ast::If>()) {
        const auto& elif = orelse[0]->as<ast::If>();
        mark(orelse[0]->loc);
        text("elif ");
        print_expr(*elif.test);
        text(":");
        print_block(elif.body);
        print_else(elif.orelse);
        return;
    }

    text("else:");
    print_block(orelse);
}

void PrintDispatch::print_loop_else(const std::vector<ast::StmtPtr>& orelse) {
    if (orelse.empty())
        return;
    text("else:");
    print_indented(orelse);
}

void PrintDispatch::print_for(const ast::For& node) {
    text(node.is_async ? "async for " : "for ");
    print_expr(*node.target);
    text(" in ");
    print_expr(*node.iter);
    text(":");
    print_indented(node.body);
    print_loop_else(node.orelse);
}

void PrintDispatch::print_while(const ast::While& node) {
    text("while ");
    print_expr(*node.test);
    text(":");
    print_indented(node.body);
    print_loop_else(node.orelse);
}

void PrintDispatch::print_try(const ast::Try& node) {
    text("try:");
    print_block(node.body);

    for (const auto& handler : node.handlers) {
        print_handler(handler);
    }

    if (!node.orelse.empty()) {
        text("else:");
        print_block(node.orelse);
    }

    if (!node.finalbody.empty()) {
        text("finally:");
        print_block(node.finalbody);
    }
}

void PrintDispatch::print_handler(const ast::ExceptHandler& handler) {
    mark(handler.loc);
    text("except");
    if (handler.type) {
        text(" ");
        print_expr(**handler.type);
    }
    if (handler.name) {
        text(" as ");
        text(*handler.name);
    }
    text(":");
    print_block(handler.body);
}

// ============================================================================
// Imports
// ============================================================================

void PrintDispatch::print_aliases(const std::vector<ast::Alias>& names) {
    bool grouped = names.size() > 1;
    if (grouped)
        text("(");

    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0)
            text(", ");
        text(names[i].name);
        if (names[i].asname && *names[i].asname != names[i].name) {
            text(" as ");
            text(*names[i].asname);
        }
    }

    if (grouped)
        text(")");
}

void PrintDispatch::print_import(const ast::Import& node) {
    if (node.names.empty())
        return;
    text("import ");
    print_aliases(node.names);
}

void PrintDispatch::print_import_from(const ast::ImportFrom& node) {
    if (node.names.empty())
        return;
    text("from ");
    text(printer_.make_import_path(node.module.value_or(".")));
    text(" import ");
    print_aliases(node.names);
}

// ============================================================================
// Simple Statements
// ============================================================================

void PrintDispatch::print_assign(const ast::Assign& node) {
    for (const auto& target : node.targets) {
        print_expr(*target);
        text(" = ");
    }
    print_expr(*node.value);
}

void PrintDispatch::print_return(const ast::Return& node) {
    text("return");
    if (node.value) {
        text(" ");
        print_expr(**node.value);
    }
}

void PrintDispatch::print_raise(const ast::Raise& node) {
    text("raise");
    if (node.exception) {
        text(" ");
        print_expr(**node.exception);
        if (node.cause) {
            text(" from ");
            print_expr(**node.cause);
        }
    }
}

void PrintDispatch::print_names(const char* keyword, const std::vector<ast::Identifier>& names) {
    if (names.empty())
        return;
    text(keyword);
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0)
            text(", ");
        text(names[i]);
    }
}

} // namespace pyemit::printer

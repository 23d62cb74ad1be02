//! # AST Factory Functions
//!
//! | Function            | Creates                         |
//! |---------------------|---------------------------------|
//! | `make_name`         | Identifier reference            |
//! | `make_constant`     | Literal of any scalar kind      |
//! | `make_call`         | Call with args and keywords     |
//! | `make_bin_op`       | Binary operation                |
//! | `make_compare`      | Single comparison               |
//! | `make_tuple` etc.   | Collection displays             |
//! | `make_emit`         | Raw template node               |
//! | `make_if`           | `if` with an else branch        |
//! | `make_function_def` | Undecorated `def`               |
//! | `make_import*`      | Import statements               |

#include "pyemit/ast/ast.hpp"

namespace pyemit::ast {

// ============================================================================
// Expressions
// ============================================================================

auto make_name(Identifier id, Loc loc) -> ExprPtr {
    return make_box<Expr>(Expr{.kind = Name{.id = std::move(id)}, .loc = std::move(loc)});
}

auto make_constant(ConstantValue value, Loc loc) -> ExprPtr {
    return make_box<Expr>(
        Expr{.kind = Constant{.value = std::move(value)}, .loc = std::move(loc)});
}

auto make_bool(bool value, Loc loc) -> ExprPtr {
    return make_constant(ConstantValue{value}, std::move(loc));
}

auto make_string(std::string value, Loc loc) -> ExprPtr {
    return make_constant(ConstantValue{std::move(value)}, std::move(loc));
}

auto make_number(double value, NumberKind kind, Loc loc) -> ExprPtr {
    return make_constant(ConstantValue{NumberValue{.value = value, .kind = kind}}, std::move(loc));
}

auto make_none(Loc loc) -> ExprPtr {
    return make_constant(ConstantValue{NoneValue{}}, std::move(loc));
}

auto make_call(ExprPtr func, std::vector<ExprPtr> args, std::vector<Keyword> keywords, Loc loc)
    -> ExprPtr {
    return make_box<Expr>(Expr{.kind = Call{.func = std::move(func),
                                            .args = std::move(args),
                                            .keywords = std::move(keywords)},
                               .loc = std::move(loc)});
}

auto make_attribute(ExprPtr value, Identifier attr, Loc loc) -> ExprPtr {
    return make_box<Expr>(
        Expr{.kind = Attribute{.value = std::move(value), .attr = std::move(attr)},
             .loc = std::move(loc)});
}

auto make_subscript(ExprPtr value, ExprPtr slice, Loc loc) -> ExprPtr {
    return make_box<Expr>(
        Expr{.kind = Subscript{.value = std::move(value), .slice = std::move(slice)},
             .loc = std::move(loc)});
}

auto make_bin_op(ExprPtr left, Operator op, ExprPtr right, Loc loc) -> ExprPtr {
    return make_box<Expr>(
        Expr{.kind = BinOp{.left = std::move(left), .op = op, .right = std::move(right)},
             .loc = std::move(loc)});
}

auto make_unary_op(UnaryOperator op, ExprPtr operand, Loc loc) -> ExprPtr {
    return make_box<Expr>(
        Expr{.kind = UnaryOp{.op = op, .operand = std::move(operand)}, .loc = std::move(loc)});
}

auto make_bool_op(BoolOperator op, std::vector<ExprPtr> values, Loc loc) -> ExprPtr {
    return make_box<Expr>(
        Expr{.kind = BoolOp{.op = op, .values = std::move(values)}, .loc = std::move(loc)});
}

auto make_compare(ExprPtr left, ComparisonOperator op, ExprPtr right, Loc loc) -> ExprPtr {
    std::vector<ExprPtr> comparators;
    comparators.push_back(std::move(right));
    return make_box<Expr>(Expr{.kind = Compare{.left = std::move(left),
                                               .ops = {op},
                                               .comparators = std::move(comparators)},
                               .loc = std::move(loc)});
}

auto make_if_exp(ExprPtr test, ExprPtr body, ExprPtr orelse, Loc loc) -> ExprPtr {
    return make_box<Expr>(Expr{
        .kind =
            IfExp{.test = std::move(test), .body = std::move(body), .orelse = std::move(orelse)},
        .loc = std::move(loc)});
}

auto make_lambda(Arguments args, ExprPtr body, Loc loc) -> ExprPtr {
    return make_box<Expr>(
        Expr{.kind = Lambda{.args = std::move(args), .body = std::move(body)},
             .loc = std::move(loc)});
}

auto make_tuple(std::vector<ExprPtr> elements, Loc loc) -> ExprPtr {
    return make_box<Expr>(
        Expr{.kind = Tuple{.elements = std::move(elements)}, .loc = std::move(loc)});
}

auto make_list(std::vector<ExprPtr> elements, Loc loc) -> ExprPtr {
    return make_box<Expr>(
        Expr{.kind = List{.elements = std::move(elements)}, .loc = std::move(loc)});
}

auto make_set(std::vector<ExprPtr> elements, Loc loc) -> ExprPtr {
    return make_box<Expr>(
        Expr{.kind = Set{.elements = std::move(elements)}, .loc = std::move(loc)});
}

auto make_dict(std::vector<ExprPtr> keys, std::vector<ExprPtr> values, Loc loc) -> ExprPtr {
    return make_box<Expr>(
        Expr{.kind = Dict{.keys = std::move(keys), .values = std::move(values)},
             .loc = std::move(loc)});
}

auto make_named_expr(ExprPtr target, ExprPtr value, Loc loc) -> ExprPtr {
    return make_box<Expr>(
        Expr{.kind = NamedExpr{.target = std::move(target), .value = std::move(value)},
             .loc = std::move(loc)});
}

auto make_starred(ExprPtr value, Loc loc) -> ExprPtr {
    return make_box<Expr>(Expr{.kind = Starred{.value = std::move(value)}, .loc = std::move(loc)});
}

auto make_emit(std::string value, std::vector<ExprPtr> args, Loc loc) -> ExprPtr {
    return make_box<Expr>(
        Expr{.kind = Emit{.value = std::move(value), .args = std::move(args)},
             .loc = std::move(loc)});
}

auto make_unsupported(std::string construct, Loc loc) -> ExprPtr {
    return make_box<Expr>(
        Expr{.kind = Unsupported{.construct = std::move(construct)}, .loc = std::move(loc)});
}

auto make_arg(Identifier name) -> Arg {
    return Arg{.arg = std::move(name), .annotation = std::nullopt};
}

// ============================================================================
// Statements
// ============================================================================

auto make_expr_stmt(ExprPtr value, Loc loc) -> StmtPtr {
    return make_box<Stmt>(Stmt{.kind = ExprStmt{.value = std::move(value)}, .loc = std::move(loc)});
}

auto make_assign(ExprPtr target, ExprPtr value, Loc loc) -> StmtPtr {
    std::vector<ExprPtr> targets;
    targets.push_back(std::move(target));
    return make_box<Stmt>(
        Stmt{.kind = Assign{.targets = std::move(targets), .value = std::move(value)},
             .loc = std::move(loc)});
}

auto make_return(std::optional<ExprPtr> value, Loc loc) -> StmtPtr {
    return make_box<Stmt>(Stmt{.kind = Return{.value = std::move(value)}, .loc = std::move(loc)});
}

auto make_if(ExprPtr test, std::vector<StmtPtr> body, std::vector<StmtPtr> orelse, Loc loc)
    -> StmtPtr {
    return make_box<Stmt>(Stmt{
        .kind = If{.test = std::move(test), .body = std::move(body), .orelse = std::move(orelse)},
        .loc = std::move(loc)});
}

auto make_while(ExprPtr test, std::vector<StmtPtr> body, Loc loc) -> StmtPtr {
    return make_box<Stmt>(
        Stmt{.kind = While{.test = std::move(test), .body = std::move(body), .orelse = {}},
             .loc = std::move(loc)});
}

auto make_for(ExprPtr target, ExprPtr iter, std::vector<StmtPtr> body, Loc loc) -> StmtPtr {
    return make_box<Stmt>(Stmt{.kind = For{.target = std::move(target),
                                           .iter = std::move(iter),
                                           .body = std::move(body),
                                           .orelse = {},
                                           .is_async = false},
                               .loc = std::move(loc)});
}

auto make_function_def(Identifier name, Arguments args, std::vector<StmtPtr> body, Loc loc)
    -> StmtPtr {
    return make_box<Stmt>(Stmt{.kind = FunctionDef{.name = std::move(name),
                                                   .args = std::move(args),
                                                   .body = std::move(body),
                                                   .decorator_list = {},
                                                   .returns = std::nullopt,
                                                   .is_async = false},
                               .loc = std::move(loc)});
}

auto make_class_def(Identifier name, std::vector<ExprPtr> bases, std::vector<StmtPtr> body,
                    Loc loc) -> StmtPtr {
    return make_box<Stmt>(Stmt{.kind = ClassDef{.name = std::move(name),
                                                .bases = std::move(bases),
                                                .body = std::move(body),
                                                .decorator_list = {}},
                               .loc = std::move(loc)});
}

auto make_import(std::vector<Alias> names, Loc loc) -> StmtPtr {
    return make_box<Stmt>(Stmt{.kind = Import{.names = std::move(names)}, .loc = std::move(loc)});
}

auto make_import_from(std::optional<Identifier> module, std::vector<Alias> names, Loc loc)
    -> StmtPtr {
    return make_box<Stmt>(
        Stmt{.kind = ImportFrom{.module = std::move(module), .names = std::move(names)},
             .loc = std::move(loc)});
}

auto make_raise(std::optional<ExprPtr> exception, Loc loc) -> StmtPtr {
    return make_box<Stmt>(
        Stmt{.kind = Raise{.exception = std::move(exception), .cause = std::nullopt},
             .loc = std::move(loc)});
}

auto make_pass(Loc loc) -> StmtPtr {
    return make_box<Stmt>(Stmt{.kind = Pass{}, .loc = std::move(loc)});
}

auto make_break(Loc loc) -> StmtPtr {
    return make_box<Stmt>(Stmt{.kind = Break{}, .loc = std::move(loc)});
}

auto make_continue(Loc loc) -> StmtPtr {
    return make_box<Stmt>(Stmt{.kind = Continue{}, .loc = std::move(loc)});
}

} // namespace pyemit::ast

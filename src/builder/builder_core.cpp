//! # Expression Builder Core
//!
//! Runtime references and the helpers shared by literal construction and
//! type tests.

#include "pyemit/builder/expr_builder.hpp"

namespace pyemit::builder {

auto literal_kind_name(const LiteralValue& value) -> const char* {
    return std::visit(
        [](const auto& v) -> const char* {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                return "unit";
            } else if constexpr (std::is_same_v<T, bool>) {
                return "bool";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return "string";
            } else if constexpr (std::is_same_v<T, char32_t>) {
                return "char";
            } else if constexpr (std::is_same_v<T, int8_t>) {
                return "int8";
            } else if constexpr (std::is_same_v<T, uint8_t>) {
                return "uint8";
            } else if constexpr (std::is_same_v<T, int16_t>) {
                return "int16";
            } else if constexpr (std::is_same_v<T, uint16_t>) {
                return "uint16";
            } else if constexpr (std::is_same_v<T, int32_t>) {
                return "int32";
            } else if constexpr (std::is_same_v<T, uint32_t>) {
                return "uint32";
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return "int64";
            } else if constexpr (std::is_same_v<T, uint64_t>) {
                return "uint64";
            } else if constexpr (std::is_same_v<T, float>) {
                return "float32";
            } else if constexpr (std::is_same_v<T, double>) {
                return "float64";
            } else if constexpr (std::is_same_v<T, DecimalValue>) {
                return "decimal";
            } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
                return "uint8[]";
            } else if constexpr (std::is_same_v<T, std::vector<uint16_t>>) {
                return "uint16[]";
            } else {
                static_assert(always_false_v<T>, "unhandled literal kind");
            }
        },
        value);
}

ExprBuilder::ExprBuilder(diag::DiagnosticSink& diagnostics, RuntimeNames names)
    : diagnostics_(diagnostics), names_(std::move(names)) {}

auto ExprBuilder::make_core_ref(const std::string& module, const std::string& member,
                                ast::Loc loc) -> ast::ExprPtr {
    return ast::make_attribute(ast::make_name(module), member, std::move(loc));
}

auto ExprBuilder::make_core_call(const std::string& module, const std::string& member,
                                 std::vector<ast::ExprPtr> args, ast::Loc loc) -> ast::ExprPtr {
    return ast::make_call(make_core_ref(module, member), std::move(args), {}, std::move(loc));
}

auto ExprBuilder::make_long(uint64_t bits, bool is_unsigned, ast::Loc loc) -> ast::ExprPtr {
    auto low = static_cast<double>(static_cast<uint32_t>(bits & 0xFFFFFFFFu));
    auto high = static_cast<double>(bits >> 32);
    auto args = ast::make_vec<ast::ExprPtr>(ast::make_number(low, ast::NumberKind::Float64),
                                            ast::make_number(high, ast::NumberKind::Float64),
                                            ast::make_bool(is_unsigned));
    return make_core_call(names_.long_module, names_.long_from_bits, std::move(args),
                          std::move(loc));
}

auto ExprBuilder::make_float32(float value, ast::Loc loc) -> ast::ExprPtr {
    auto args = ast::make_vec<ast::ExprPtr>(
        ast::make_number(static_cast<double>(value), ast::NumberKind::Float32));
    return make_core_call(names_.util_module, names_.fround, std::move(args), std::move(loc));
}

} // namespace pyemit::builder

//! # Semantic Type Helpers
//!
//! Factory functions and `type_to_string()` for diagnostics.

#include "pyemit/types/type.hpp"

#include <sstream>
#include <string_view>

namespace pyemit::types {

namespace {

auto make_type(decltype(Type::kind) kind) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = std::move(kind);
    return type;
}

auto join_types(const std::vector<TypePtr>& types, std::string_view sep) -> std::string {
    std::ostringstream ss;
    for (size_t i = 0; i < types.size(); ++i) {
        if (i > 0)
            ss << sep;
        ss << type_to_string(types[i]);
    }
    return ss.str();
}

} // namespace

auto make_any() -> TypePtr {
    return make_type(AnyType{});
}

auto make_unit() -> TypePtr {
    return make_type(UnitType{});
}

auto make_boolean() -> TypePtr {
    return make_type(BooleanType{});
}

auto make_char() -> TypePtr {
    return make_type(CharType{});
}

auto make_string() -> TypePtr {
    return make_type(StringType{});
}

auto make_regex() -> TypePtr {
    return make_type(RegexType{});
}

auto make_number(NumberKind kind) -> TypePtr {
    return make_type(NumberType{kind});
}

auto make_extended(ExtendedKind kind) -> TypePtr {
    return make_type(ExtendedNumberType{kind});
}

auto make_enum(std::string name) -> TypePtr {
    return make_type(EnumType{std::move(name)});
}

auto make_array(TypePtr element) -> TypePtr {
    return make_type(ArrayType{std::move(element)});
}

auto make_tuple(std::vector<TypePtr> elements) -> TypePtr {
    return make_type(TupleType{std::move(elements)});
}

auto make_list(TypePtr element) -> TypePtr {
    return make_type(ListType{std::move(element)});
}

auto make_func(std::vector<TypePtr> params, TypePtr ret) -> TypePtr {
    return make_type(FuncType{std::move(params), std::move(ret)});
}

auto make_option(TypePtr inner) -> TypePtr {
    return make_type(OptionType{std::move(inner)});
}

auto make_generic_param(std::string name) -> TypePtr {
    return make_type(GenericParamType{std::move(name)});
}

auto make_erased_union(std::vector<TypePtr> types) -> TypePtr {
    return make_type(ErasedUnionType{std::move(types)});
}

auto make_declared(std::string name, DeclaredKind kind, std::vector<TypePtr> type_args)
    -> TypePtr {
    return make_type(DeclaredType{std::move(name), kind, std::move(type_args)});
}

auto number_kind_to_string(NumberKind kind) -> const char* {
    switch (kind) {
    case NumberKind::Int8:
        return "int8";
    case NumberKind::UInt8:
        return "uint8";
    case NumberKind::Int16:
        return "int16";
    case NumberKind::UInt16:
        return "uint16";
    case NumberKind::Int32:
        return "int32";
    case NumberKind::UInt32:
        return "uint32";
    case NumberKind::Float32:
        return "float32";
    case NumberKind::Float64:
        return "float64";
    }
    return "?";
}

auto extended_kind_to_string(ExtendedKind kind) -> const char* {
    switch (kind) {
    case ExtendedKind::Int64:
        return "int64";
    case ExtendedKind::UInt64:
        return "uint64";
    case ExtendedKind::Decimal:
        return "decimal";
    case ExtendedKind::BigInt:
        return "bigint";
    }
    return "?";
}

auto type_to_string(const TypePtr& type) -> std::string {
    if (!type)
        return "<null>";
    return type_to_string(*type);
}

auto type_to_string(const Type& type) -> std::string {
    return std::visit(
        [](const auto& t) -> std::string {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, AnyType>) {
                return "any";
            } else if constexpr (std::is_same_v<T, UnitType>) {
                return "unit";
            } else if constexpr (std::is_same_v<T, BooleanType>) {
                return "bool";
            } else if constexpr (std::is_same_v<T, CharType>) {
                return "char";
            } else if constexpr (std::is_same_v<T, StringType>) {
                return "string";
            } else if constexpr (std::is_same_v<T, RegexType>) {
                return "regex";
            } else if constexpr (std::is_same_v<T, NumberType>) {
                return number_kind_to_string(t.kind);
            } else if constexpr (std::is_same_v<T, ExtendedNumberType>) {
                return extended_kind_to_string(t.kind);
            } else if constexpr (std::is_same_v<T, EnumType>) {
                return "enum " + t.name;
            } else if constexpr (std::is_same_v<T, ArrayType>) {
                return type_to_string(t.element) + "[]";
            } else if constexpr (std::is_same_v<T, TupleType>) {
                return "(" + join_types(t.elements, " * ") + ")";
            } else if constexpr (std::is_same_v<T, ListType>) {
                return type_to_string(t.element) + " list";
            } else if constexpr (std::is_same_v<T, FuncType>) {
                return "(" + join_types(t.params, ", ") + ") -> " + type_to_string(t.ret);
            } else if constexpr (std::is_same_v<T, OptionType>) {
                return type_to_string(t.inner) + " option";
            } else if constexpr (std::is_same_v<T, GenericParamType>) {
                return "'" + t.name;
            } else if constexpr (std::is_same_v<T, ErasedUnionType>) {
                return "U[" + join_types(t.types, ", ") + "]";
            } else if constexpr (std::is_same_v<T, DeclaredType>) {
                if (t.type_args.empty())
                    return t.name;
                return t.name + "[" + join_types(t.type_args, ", ") + "]";
            } else {
                static_assert(always_false_v<T>, "unhandled type kind");
            }
        },
        type.kind);
}

} // namespace pyemit::types

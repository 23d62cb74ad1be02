//! # Semantic Types
//!
//! The source-language types the front end attaches to values. The printer
//! never looks at them; only the expression builder does, to decide how a
//! literal is constructed and how a runtime type test is spelled.

#ifndef PYEMIT_TYPES_TYPE_HPP
#define PYEMIT_TYPES_TYPE_HPP

#include "pyemit/ast/ast_common.hpp"

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace pyemit::types {

struct Type;
using TypePtr = std::shared_ptr<Type>;

using ast::NumberKind;

/// Numeric types the target cannot hold natively in a double.
enum class ExtendedKind {
    Int64,
    UInt64,
    Decimal,
    BigInt,
};

/// User-declared nominal type categories.
enum class DeclaredKind {
    Record,
    Union,
    Class,
    Interface,
};

// Primitive types
struct AnyType {};
struct UnitType {};
struct BooleanType {};
struct CharType {};
struct StringType {};
struct RegexType {};

struct NumberType {
    NumberKind kind;
};

struct ExtendedNumberType {
    ExtendedKind kind;
};

/// Numeric enum; literals reference the enum by name.
struct EnumType {
    std::string name;
};

// Compound types
struct ArrayType {
    TypePtr element;
};

struct TupleType {
    std::vector<TypePtr> elements;
};

struct ListType {
    TypePtr element;
};

struct FuncType {
    std::vector<TypePtr> params;
    TypePtr ret;
};

struct OptionType {
    TypePtr inner;
};

/// Unresolved generic parameter `T`.
struct GenericParamType {
    std::string name;
};

/// Union whose cases are erased at runtime.
struct ErasedUnionType {
    std::vector<TypePtr> types;
};

/// Record, union, class or interface declared in the source program.
struct DeclaredType {
    std::string name;
    DeclaredKind kind;
    std::vector<TypePtr> type_args;
};

struct Type {
    std::variant<AnyType, UnitType, BooleanType, CharType, StringType, RegexType, NumberType,
                 ExtendedNumberType, EnumType, ArrayType, TupleType, ListType, FuncType, OptionType,
                 GenericParamType, ErasedUnionType, DeclaredType>
        kind;

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

// Helper functions
[[nodiscard]] auto make_any() -> TypePtr;
[[nodiscard]] auto make_unit() -> TypePtr;
[[nodiscard]] auto make_boolean() -> TypePtr;
[[nodiscard]] auto make_char() -> TypePtr;
[[nodiscard]] auto make_string() -> TypePtr;
[[nodiscard]] auto make_regex() -> TypePtr;
[[nodiscard]] auto make_number(NumberKind kind) -> TypePtr;
[[nodiscard]] auto make_extended(ExtendedKind kind) -> TypePtr;
[[nodiscard]] auto make_enum(std::string name) -> TypePtr;
[[nodiscard]] auto make_array(TypePtr element) -> TypePtr;
[[nodiscard]] auto make_tuple(std::vector<TypePtr> elements) -> TypePtr;
[[nodiscard]] auto make_list(TypePtr element) -> TypePtr;
[[nodiscard]] auto make_func(std::vector<TypePtr> params, TypePtr ret) -> TypePtr;
[[nodiscard]] auto make_option(TypePtr inner) -> TypePtr;
[[nodiscard]] auto make_generic_param(std::string name) -> TypePtr;
[[nodiscard]] auto make_erased_union(std::vector<TypePtr> types) -> TypePtr;
[[nodiscard]] auto make_declared(std::string name, DeclaredKind kind,
                                 std::vector<TypePtr> type_args = {}) -> TypePtr;

[[nodiscard]] auto number_kind_to_string(NumberKind kind) -> const char*;
[[nodiscard]] auto extended_kind_to_string(ExtendedKind kind) -> const char*;

/// Human-readable name, used in diagnostics.
[[nodiscard]] auto type_to_string(const Type& type) -> std::string;
[[nodiscard]] auto type_to_string(const TypePtr& type) -> std::string;

} // namespace pyemit::types

#endif // PYEMIT_TYPES_TYPE_HPP

//! # Literal Construction
//!
//! `make_type_const()` pairs a semantic type with the literal the front end
//! produced for it. Scalars are accepted only when the value's C++ type is
//! the one the semantic type implies.
//!
//! | Number kind | Value type |
//! |-------------|------------|
//! | `Int8`      | `int8_t`   |
//! | `UInt8`     | `uint8_t`  |
//! | `Int16`     | `int16_t`  |
//! | `UInt16`    | `uint16_t` |
//! | `Int32`     | `int32_t`  |
//! | `UInt32`    | `uint32_t` |
//! | `Float32`   | `float`    |
//! | `Float64`   | `double`   |

#include "pyemit/builder/expr_builder.hpp"
#include "pyemit/log/log.hpp"

#include <charconv>

namespace pyemit::builder {

namespace {

/// The value as a double when its C++ type matches `kind`.
auto number_literal(ast::NumberKind kind, const LiteralValue& value) -> std::optional<double> {
    switch (kind) {
    case ast::NumberKind::Int8:
        if (const auto* v = std::get_if<int8_t>(&value))
            return static_cast<double>(*v);
        break;
    case ast::NumberKind::UInt8:
        if (const auto* v = std::get_if<uint8_t>(&value))
            return static_cast<double>(*v);
        break;
    case ast::NumberKind::Int16:
        if (const auto* v = std::get_if<int16_t>(&value))
            return static_cast<double>(*v);
        break;
    case ast::NumberKind::UInt16:
        if (const auto* v = std::get_if<uint16_t>(&value))
            return static_cast<double>(*v);
        break;
    case ast::NumberKind::Int32:
        if (const auto* v = std::get_if<int32_t>(&value))
            return static_cast<double>(*v);
        break;
    case ast::NumberKind::UInt32:
        if (const auto* v = std::get_if<uint32_t>(&value))
            return static_cast<double>(*v);
        break;
    case ast::NumberKind::Float32:
        if (const auto* v = std::get_if<float>(&value))
            return static_cast<double>(*v);
        break;
    case ast::NumberKind::Float64:
        if (const auto* v = std::get_if<double>(&value))
            return *v;
        break;
    }
    return std::nullopt;
}

/// Encodes a code point as UTF-8. Returns false for surrogates and values
/// past U+10FFFF.
auto encode_utf8(char32_t cp, std::string& out) -> bool {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        if (cp >= 0xD800 && cp <= 0xDFFF)
            return false;
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp <= 0x10FFFF) {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        return false;
    }
    return true;
}

auto parse_decimal(const std::string& text) -> std::optional<double> {
    double result = 0.0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (first != last && *first == '+')
        ++first;
    auto [ptr, ec] = std::from_chars(first, last, result);
    if (ec != std::errc{} || ptr != last)
        return std::nullopt;
    return result;
}

template <typename T>
auto make_number_list(const std::vector<T>& items, ast::NumberKind kind, ast::Loc loc)
    -> ast::ExprPtr {
    std::vector<ast::ExprPtr> elements;
    elements.reserve(items.size());
    for (auto item : items) {
        elements.push_back(ast::make_number(static_cast<double>(item), kind));
    }
    return ast::make_list(std::move(elements), std::move(loc));
}

} // namespace

auto ExprBuilder::make_type_const(const types::Type& type, const LiteralValue& value, ast::Loc loc)
    -> ast::ExprPtr {
    return std::visit(
        [this, &type, &value, &loc](const auto& t) -> ast::ExprPtr {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, types::UnitType>) {
                return ast::make_none(loc);
            } else if constexpr (std::is_same_v<T, types::BooleanType>) {
                if (const auto* b = std::get_if<bool>(&value))
                    return ast::make_bool(*b, loc);
            } else if constexpr (std::is_same_v<T, types::StringType>) {
                if (const auto* s = std::get_if<std::string>(&value))
                    return ast::make_string(*s, loc);
            } else if constexpr (std::is_same_v<T, types::CharType>) {
                if (const auto* c = std::get_if<char32_t>(&value)) {
                    std::string utf8;
                    if (encode_utf8(*c, utf8))
                        return ast::make_string(std::move(utf8), loc);
                }
            } else if constexpr (std::is_same_v<T, types::NumberType>) {
                if (auto number = number_literal(t.kind, value)) {
                    if (t.kind == ast::NumberKind::Float32)
                        return make_float32(std::get<float>(value), loc);
                    return ast::make_number(*number, t.kind, loc);
                }
            } else if constexpr (std::is_same_v<T, types::ExtendedNumberType>) {
                switch (t.kind) {
                case types::ExtendedKind::Int64:
                    if (const auto* v = std::get_if<int64_t>(&value))
                        return make_long(static_cast<uint64_t>(*v), false, loc);
                    break;
                case types::ExtendedKind::UInt64:
                    if (const auto* v = std::get_if<uint64_t>(&value))
                        return make_long(*v, true, loc);
                    break;
                case types::ExtendedKind::Decimal:
                    if (const auto* v = std::get_if<DecimalValue>(&value)) {
                        if (auto parsed = parse_decimal(v->text))
                            return ast::make_number(*parsed, ast::NumberKind::Float64, loc);
                    }
                    break;
                case types::ExtendedKind::BigInt:
                    break;
                }
            } else if constexpr (std::is_same_v<T, types::EnumType>) {
                return make_enum_const(t, value, loc);
            } else if constexpr (std::is_same_v<T, types::ArrayType>) {
                return make_array_const(t, value, loc);
            }
            return mismatch(type, value, loc);
        },
        type.kind);
}

auto ExprBuilder::make_enum_const(const types::EnumType& type, const LiteralValue& value,
                                  ast::Loc loc) -> ast::ExprPtr {
    if (std::holds_alternative<int64_t>(value) || std::holds_alternative<uint64_t>(value)) {
        diagnostics_.unsupported(diag::codes::ENUM_64_BIT,
                                 "64-bit enum " + type.name + " has no literal representation",
                                 loc);
        return ast::make_none(loc);
    }

    static constexpr ast::NumberKind integral_kinds[] = {
        ast::NumberKind::Int8,  ast::NumberKind::UInt8,  ast::NumberKind::Int16,
        ast::NumberKind::UInt16, ast::NumberKind::Int32, ast::NumberKind::UInt32,
    };
    for (auto kind : integral_kinds) {
        if (auto number = number_literal(kind, value)) {
            auto args = ast::make_vec<ast::ExprPtr>(ast::make_number(*number, kind));
            return ast::make_call(ast::make_name(type.name), std::move(args), {}, std::move(loc));
        }
    }

    return mismatch(types::Type{type}, value, loc);
}

auto ExprBuilder::make_array_const(const types::ArrayType& type, const LiteralValue& value,
                                   ast::Loc loc) -> ast::ExprPtr {
    if (type.element && type.element->is<types::NumberType>()) {
        auto kind = type.element->as<types::NumberType>().kind;
        if (const auto* bytes = std::get_if<std::vector<uint8_t>>(&value))
            return make_number_list(*bytes, kind, std::move(loc));
        if (const auto* words = std::get_if<std::vector<uint16_t>>(&value))
            return make_number_list(*words, kind, std::move(loc));
    }
    return mismatch(types::Type{type}, value, loc);
}

auto ExprBuilder::mismatch(const types::Type& type, const LiteralValue& value, ast::Loc loc)
    -> ast::ExprPtr {
    PYEMIT_LOG_DEBUG("builder", "No literal for " << types::type_to_string(type) << " from "
                                                  << literal_kind_name(value));
    diagnostics_.unsupported(diag::codes::LITERAL_TYPE_MISMATCH,
                             "cannot build a " + types::type_to_string(type) + " literal from a " +
                                 literal_kind_name(value) + " value",
                             loc);
    return ast::make_none(std::move(loc));
}

} // namespace pyemit::builder

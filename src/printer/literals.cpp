//! # Literal Rendering

#include "pyemit/printer/literals.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>

namespace pyemit::printer {

namespace {

void append_hex_escape(std::string& out, char prefix, uint32_t value, int digits) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "\\%c%0*x", prefix, digits, value);
    out += buf;
}

/// Decodes one UTF-8 sequence starting at `text[i]`. Returns the sequence
/// length, or 0 if it is malformed.
auto decode_utf8(std::string_view text, size_t i, uint32_t& cp) -> size_t {
    auto byte = [&](size_t k) { return static_cast<unsigned char>(text[k]); };
    unsigned char lead = byte(i);

    size_t len;
    if (lead < 0x80) {
        cp = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        len = 2;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4;
        cp = lead & 0x07;
    } else {
        return 0;
    }

    if (i + len > text.size())
        return 0;
    for (size_t k = 1; k < len; ++k) {
        if ((byte(i + k) & 0xC0) != 0x80)
            return 0;
        cp = (cp << 6) | (byte(i + k) & 0x3F);
    }

    // Reject overlong forms, surrogates and out-of-range values.
    static constexpr uint32_t min_for_len[] = {0, 0, 0x80, 0x800, 0x10000};
    if (cp < min_for_len[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
        return 0;
    return len;
}

} // namespace

auto quote_string(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size() + 2);
    out += '"';

    size_t i = 0;
    while (i < text.size()) {
        uint32_t cp = 0;
        size_t len = decode_utf8(text, i, cp);
        if (len == 0) {
            append_hex_escape(out, 'x', static_cast<unsigned char>(text[i]), 2);
            ++i;
            continue;
        }
        i += len;

        switch (cp) {
        case '\\':
            out += "\\\\";
            break;
        case '"':
            out += "\\\"";
            break;
        case '\'':
            out += "\\'";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        default:
            if (cp < 0x20 || cp == 0x7F) {
                append_hex_escape(out, 'x', cp, 2);
            } else if (cp < 0x80) {
                out += static_cast<char>(cp);
            } else if (cp <= 0xFFFF) {
                append_hex_escape(out, 'u', cp, 4);
            } else {
                append_hex_escape(out, 'U', cp, 8);
            }
        }
    }

    out += '"';
    return out;
}

auto format_number(const ast::NumberValue& number) -> std::string {
    double value = number.value;

    if (std::isnan(value))
        return "float(\"nan\")";
    if (std::isinf(value))
        return value > 0 ? "float(\"inf\")" : "float(\"-inf\")";

    char buf[64];
    if (ast::is_integral(number.kind) && std::trunc(value) == value && std::fabs(value) < 9.0e15) {
        auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), static_cast<int64_t>(value));
        return std::string(buf, end);
    }

    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    std::string text(buf, end);
    if (text.find_first_of(".e") == std::string::npos) {
        text += ".0";
    }
    return text;
}

auto format_constant(const ast::ConstantValue& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, bool>) {
                return v ? "True" : "False";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return quote_string(v);
            } else if constexpr (std::is_same_v<T, ast::NumberValue>) {
                return format_number(v);
            } else if constexpr (std::is_same_v<T, ast::NoneValue>) {
                return "None";
            } else {
                static_assert(always_false_v<T>, "unhandled constant kind");
            }
        },
        value);
}

} // namespace pyemit::printer

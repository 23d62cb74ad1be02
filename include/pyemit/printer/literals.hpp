//! # Literal Rendering
//!
//! Text forms of scalar constants.
//!
//! | Value                 | Rendering                          |
//! |-----------------------|------------------------------------|
//! | `true` / `false`      | `True` / `False`                   |
//! | none                  | `None`                             |
//! | integral number kinds | `42`, `-7`                         |
//! | float number kinds    | `1.5`, `42.0`, `1e+21`             |
//! | non-finite            | `float("inf")`, `float("nan")`     |
//! | string                | `"a\nb"`, `"\u00e9"`               |

#ifndef PYEMIT_PRINTER_LITERALS_HPP
#define PYEMIT_PRINTER_LITERALS_HPP

#include "pyemit/ast/ast_exprs.hpp"

#include <string>
#include <string_view>

namespace pyemit::printer {

/// Double-quoted string literal with every control character, quote and
/// non-ASCII code point escaped. Malformed UTF-8 bytes become `\xNN`.
[[nodiscard]] auto quote_string(std::string_view text) -> std::string;

/// Shortest round-trip form; floats always carry a `.` or an exponent.
[[nodiscard]] auto format_number(const ast::NumberValue& number) -> std::string;

[[nodiscard]] auto format_constant(const ast::ConstantValue& value) -> std::string;

} // namespace pyemit::printer

#endif // PYEMIT_PRINTER_LITERALS_HPP

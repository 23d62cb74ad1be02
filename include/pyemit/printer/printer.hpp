//! # Printer
//!
//! Stateful text emitter for one compilation unit. Tracks the current output
//! line, column and indentation depth, buffers text until `flush()`, and
//! forwards source-map coordinates as located nodes are printed.
//!
//! ## Bookkeeping
//!
//! | Field    | Start | Changes on                                     |
//! |----------|-------|------------------------------------------------|
//! | `line`   | 1     | `newline()`                                    |
//! | `column` | 0     | `print()` (indentation included), `newline()`  |
//! | `indent` | 0     | `push_indent()` / `pop_indent()`, floors at 0  |
//!
//! Columns count Unicode code points, not bytes. Output is append-only: no
//! operation rewrites text that was already printed.
//!
//! ## Ownership
//!
//! The printer owns its `io::Writer` and closes it in the destructor. The
//! source-map generator is borrowed and must outlive the printer. A printer
//! is never shared between threads or compilation units.

#ifndef PYEMIT_PRINTER_PRINTER_HPP
#define PYEMIT_PRINTER_PRINTER_HPP

#include "pyemit/ast/ast_common.hpp"
#include "pyemit/common.hpp"
#include "pyemit/io/writer.hpp"
#include "pyemit/sourcemap/source_map.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pyemit::printer {

struct PrinterOptions {
    std::string indent_unit = "    ";
    std::string line_terminator = "\n";
};

class Printer {
public:
    Printer(Box<io::Writer> writer, sourcemap::SourceMapGenerator& source_map,
            PrinterOptions options = {});
    ~Printer();

    Printer(const Printer&) = delete;
    Printer& operator=(const Printer&) = delete;

    /// Appends `text`, indenting first when at the start of a line.
    ///
    /// When `loc` is given, a mapping is recorded at the column of the first
    /// character of `text`, after any indentation. `text` must not contain a
    /// line terminator.
    void print(std::string_view text, const std::optional<ast::SourceLocation>& loc = std::nullopt);

    void newline();

    void push_indent();

    /// Decrements the indentation depth; never goes below zero.
    void pop_indent();

    /// Records a zero-width mapping at the current position.
    void add_location(const std::optional<ast::SourceLocation>& loc);

    /// Writes the buffered text to the sink and clears the buffer.
    auto flush() -> Result<size_t>;

    /// Delegates to the sink's import-path hook.
    auto make_import_path(std::string_view module) -> std::string;

    [[nodiscard]] auto line() const -> uint32_t {
        return line_;
    }

    [[nodiscard]] auto column() const -> uint32_t {
        return column_;
    }

    [[nodiscard]] auto indent() const -> uint32_t {
        return indent_;
    }

    /// Text printed since the last flush.
    [[nodiscard]] auto buffer() const -> const std::string& {
        return buffer_;
    }

    [[nodiscard]] auto bytes_flushed() const -> size_t {
        return bytes_flushed_;
    }

    [[nodiscard]] auto options() const -> const PrinterOptions& {
        return options_;
    }

private:
    Box<io::Writer> writer_;
    sourcemap::SourceMapGenerator& source_map_;
    PrinterOptions options_;

    uint32_t line_ = 1;
    uint32_t column_ = 0;
    uint32_t indent_ = 0;
    std::string buffer_;
    size_t bytes_flushed_ = 0;

    void record(const ast::SourceLocation& loc);
};

/// Number of Unicode code points in a UTF-8 string.
[[nodiscard]] auto code_point_count(std::string_view text) -> uint32_t;

} // namespace pyemit::printer

#endif // PYEMIT_PRINTER_PRINTER_HPP

//! # Printer Core
//!
//! | Method          | Description                                  |
//! |-----------------|----------------------------------------------|
//! | `print()`       | Indent if at column 0, append, map location  |
//! | `newline()`     | Terminate the line, reset column             |
//! | `push_indent()` | Increase indentation depth                   |
//! | `pop_indent()`  | Decrease indentation depth (floors at 0)     |
//! | `flush()`       | Hand the buffer to the sink                  |

#include "pyemit/printer/printer.hpp"

#include "pyemit/log/log.hpp"

namespace pyemit::printer {

auto code_point_count(std::string_view text) -> uint32_t {
    uint32_t count = 0;
    for (char c : text) {
        // Continuation bytes are 10xxxxxx.
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80)
            ++count;
    }
    return count;
}

Printer::Printer(Box<io::Writer> writer, sourcemap::SourceMapGenerator& source_map,
                 PrinterOptions options)
    : writer_(std::move(writer)), source_map_(source_map), options_(std::move(options)) {}

Printer::~Printer() {
    if (writer_) {
        writer_->close();
    }
}

void Printer::print(std::string_view text, const std::optional<ast::SourceLocation>& loc) {
    if (column_ == 0 && indent_ > 0) {
        for (uint32_t i = 0; i < indent_; ++i) {
            buffer_ += options_.indent_unit;
        }
        column_ += indent_ * code_point_count(options_.indent_unit);
    }

    if (loc) {
        record(*loc);
    }

    buffer_.append(text);
    column_ += code_point_count(text);
}

void Printer::newline() {
    buffer_ += options_.line_terminator;
    ++line_;
    column_ = 0;
}

void Printer::push_indent() {
    ++indent_;
}

void Printer::pop_indent() {
    if (indent_ > 0)
        --indent_;
}

void Printer::add_location(const std::optional<ast::SourceLocation>& loc) {
    if (loc) {
        record(*loc);
    }
}

void Printer::record(const ast::SourceLocation& loc) {
    source_map_.add_mapping(loc.start.line, loc.start.column, line_, column_,
                            loc.identifier_name);
}

auto Printer::flush() -> Result<size_t> {
    if (buffer_.empty()) {
        return size_t{0};
    }

    auto result = writer_->write(buffer_);
    buffer_.clear();

    if (is_err(result)) {
        PYEMIT_LOG_ERROR("printer", "Flush failed: " << unwrap_err(result));
        return result;
    }

    bytes_flushed_ += unwrap(result);
    PYEMIT_LOG_TRACE("printer", "Flushed " << unwrap(result) << " bytes, now at line " << line_);
    return result;
}

auto Printer::make_import_path(std::string_view module) -> std::string {
    return writer_->make_import_path(module);
}

} // namespace pyemit::printer

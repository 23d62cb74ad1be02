//! # Output Sinks
//!
//! Where flushed target text goes. The printer owns exactly one `Writer`
//! and releases it in its destructor, so the sink is closed on every exit
//! path, including a `FatalTranslationError` unwinding out of a declaration.
//!
//! A writer also owns the import-path hook: it knows the output layout, so it
//! translates a logical module reference into the path the target expects.

#ifndef PYEMIT_IO_WRITER_HPP
#define PYEMIT_IO_WRITER_HPP

#include "pyemit/common.hpp"

#include <fstream>
#include <functional>
#include <string>
#include <string_view>

namespace pyemit::io {

/// Maps a logical module reference to an output import path.
using ImportPathHook = std::function<std::string(std::string_view)>;

/// Abstract output sink.
class Writer {
public:
    virtual ~Writer() = default;

    /// Writes one chunk. Returns the number of bytes accepted.
    virtual auto write(std::string_view chunk) -> Result<size_t> = 0;

    /// Translates a module reference for an import statement.
    virtual auto make_import_path(std::string_view module) -> std::string = 0;

    /// Releases the underlying resource. Idempotent.
    virtual void close() = 0;
};

/// Base for writers that take an optional import-path hook.
class HookedWriter : public Writer {
public:
    explicit HookedWriter(ImportPathHook hook);

    auto make_import_path(std::string_view module) -> std::string override;

private:
    ImportPathHook hook_;
};

/// Appends to a caller-owned string, which must outlive the writer.
class StringWriter : public HookedWriter {
public:
    explicit StringWriter(std::string& out, ImportPathHook hook = nullptr);

    auto write(std::string_view chunk) -> Result<size_t> override;
    void close() override;

    [[nodiscard]] auto chunk_count() const -> size_t {
        return chunks_;
    }

private:
    std::string& out_;
    size_t chunks_ = 0;
    bool closed_ = false;
};

/// Writes to a file, truncating it on open.
class FileWriter : public HookedWriter {
public:
    explicit FileWriter(const std::string& path, ImportPathHook hook = nullptr);
    ~FileWriter() override;

    auto write(std::string_view chunk) -> Result<size_t> override;
    void close() override;

    [[nodiscard]] auto is_open() const -> bool {
        return file_.is_open();
    }

private:
    std::string path_;
    std::ofstream file_;
};

} // namespace pyemit::io

#endif // PYEMIT_IO_WRITER_HPP

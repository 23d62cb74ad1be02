//! # Output Sink Implementations

#include "pyemit/io/writer.hpp"

namespace pyemit::io {

HookedWriter::HookedWriter(ImportPathHook hook) : hook_(std::move(hook)) {}

auto HookedWriter::make_import_path(std::string_view module) -> std::string {
    if (hook_) {
        return hook_(module);
    }
    return std::string(module);
}

// ============================================================================
// StringWriter
// ============================================================================

StringWriter::StringWriter(std::string& out, ImportPathHook hook)
    : HookedWriter(std::move(hook)), out_(out) {}

auto StringWriter::write(std::string_view chunk) -> Result<size_t> {
    if (closed_) {
        return std::string("write after close");
    }
    out_.append(chunk);
    ++chunks_;
    return chunk.size();
}

void StringWriter::close() {
    closed_ = true;
}

// ============================================================================
// FileWriter
// ============================================================================

FileWriter::FileWriter(const std::string& path, ImportPathHook hook)
    : HookedWriter(std::move(hook)), path_(path),
      file_(path, std::ios::out | std::ios::trunc | std::ios::binary) {}

FileWriter::~FileWriter() {
    close();
}

auto FileWriter::write(std::string_view chunk) -> Result<size_t> {
    if (!file_.is_open()) {
        return "cannot write to " + path_ + ": file is not open";
    }
    file_.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    if (!file_) {
        return "cannot write to " + path_;
    }
    return chunk.size();
}

void FileWriter::close() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

} // namespace pyemit::io

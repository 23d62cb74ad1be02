//! # Diagnostics Implementation

#include "pyemit/diag/diagnostics.hpp"

#include "pyemit/log/log.hpp"

#include <sstream>

namespace pyemit::diag {

auto severity_name(Severity severity) -> const char* {
    switch (severity) {
    case Severity::Error:
        return "error";
    case Severity::Warning:
        return "warning";
    case Severity::Info:
        return "info";
    }
    return "error";
}

auto format_diagnostic(const Diagnostic& diag) -> std::string {
    std::ostringstream ss;
    ss << (diag.file_name.empty() ? "<unit>" : diag.file_name);
    if (diag.loc) {
        ss << ":" << diag.loc->start.line << ":" << diag.loc->start.column;
    }
    ss << ": " << severity_name(diag.severity) << "[" << diag.code << "]: " << diag.message;
    return ss.str();
}

FatalTranslationError::FatalTranslationError(Diagnostic diag)
    : std::runtime_error(format_diagnostic(diag)), diag_(std::move(diag)) {}

DiagnosticSink::DiagnosticSink(std::string file_name, FailurePolicy policy)
    : file_name_(std::move(file_name)), policy_(policy) {}

void DiagnosticSink::add(Diagnostic diag) {
    if (diag.file_name.empty()) {
        diag.file_name = file_name_;
    }

    switch (diag.severity) {
    case Severity::Error:
        ++error_count_;
        PYEMIT_LOG_ERROR("diag", format_diagnostic(diag));
        break;
    case Severity::Warning:
        PYEMIT_LOG_WARN("diag", format_diagnostic(diag));
        break;
    case Severity::Info:
        PYEMIT_LOG_INFO("diag", format_diagnostic(diag));
        break;
    }

    diagnostics_.push_back(std::move(diag));
}

void DiagnosticSink::error(std::string code, std::string message,
                           std::optional<ast::SourceLocation> loc) {
    add(Diagnostic{.severity = Severity::Error,
                   .code = std::move(code),
                   .message = std::move(message),
                   .file_name = file_name_,
                   .loc = std::move(loc)});
}

void DiagnosticSink::warning(std::string code, std::string message,
                             std::optional<ast::SourceLocation> loc) {
    add(Diagnostic{.severity = Severity::Warning,
                   .code = std::move(code),
                   .message = std::move(message),
                   .file_name = file_name_,
                   .loc = std::move(loc)});
}

void DiagnosticSink::info(std::string code, std::string message,
                          std::optional<ast::SourceLocation> loc) {
    add(Diagnostic{.severity = Severity::Info,
                   .code = std::move(code),
                   .message = std::move(message),
                   .file_name = file_name_,
                   .loc = std::move(loc)});
}

void DiagnosticSink::unsupported(std::string code, std::string message,
                                 std::optional<ast::SourceLocation> loc) {
    Diagnostic diag{.severity = Severity::Error,
                    .code = std::move(code),
                    .message = std::move(message),
                    .file_name = file_name_,
                    .loc = std::move(loc)};
    if (policy_ == FailurePolicy::Abort) {
        add(diag);
        throw FatalTranslationError(std::move(diag));
    }
    add(std::move(diag));
}

auto DiagnosticSink::drain() -> std::vector<Diagnostic> {
    std::vector<Diagnostic> out;
    out.swap(diagnostics_);
    error_count_ = 0;
    return out;
}

} // namespace pyemit::diag

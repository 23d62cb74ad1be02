//! # Diagnostics
//!
//! Per-compilation-unit collector for recoverable problems found while
//! building or printing target code.
//!
//! ## Error Codes
//!
//! | Code | Severity | Meaning                                                  |
//! |------|----------|----------------------------------------------------------|
//! | P001 | Error    | Runtime type test against a declared record/union/class  |
//! | P002 | Error    | Runtime type test against option/generic/erased union    |
//! | P003 | Error    | Unrecognised (type, literal) pairing                     |
//! | P004 | Error    | 64-bit enum literal                                      |
//! | P005 | Error    | AST construct the printer does not render                |
//! | P010 | Error    | Output sink write failure                                |
//! | P011 | Info     | Printing cancelled between declarations                  |
//!
//! ## Failure Policy
//!
//! Under `FailurePolicy::Recover` every problem is recorded and the caller
//! substitutes a placeholder. Under `FailurePolicy::Abort`, `unsupported()`
//! records the diagnostic and then throws `FatalTranslationError`, which the
//! driver catches at the compilation-unit boundary.

#ifndef PYEMIT_DIAG_DIAGNOSTICS_HPP
#define PYEMIT_DIAG_DIAGNOSTICS_HPP

#include "pyemit/ast/ast_common.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace pyemit::diag {

namespace codes {
constexpr const char* UNSUPPORTED_DECLARED_TYPE_TEST = "P001";
constexpr const char* UNSUPPORTED_TYPE_TEST = "P002";
constexpr const char* LITERAL_TYPE_MISMATCH = "P003";
constexpr const char* ENUM_64_BIT = "P004";
constexpr const char* UNSUPPORTED_NODE = "P005";
constexpr const char* WRITE_FAILED = "P010";
constexpr const char* CANCELLED = "P011";
} // namespace codes

enum class Severity {
    Error,
    Warning,
    Info,
};

enum class FailurePolicy {
    Recover, ///< Record and continue with a placeholder.
    Abort,   ///< Record, then throw FatalTranslationError.
};

[[nodiscard]] auto severity_name(Severity severity) -> const char*;

struct Diagnostic {
    Severity severity = Severity::Error;
    std::string code;
    std::string message;
    std::string file_name;
    std::optional<ast::SourceLocation> loc;
};

/// `file:line:col: error[P001]: message`
[[nodiscard]] auto format_diagnostic(const Diagnostic& diag) -> std::string;

/// Thrown by `DiagnosticSink::unsupported()` under `FailurePolicy::Abort`.
class FatalTranslationError : public std::runtime_error {
public:
    explicit FatalTranslationError(Diagnostic diag);

    [[nodiscard]] auto diagnostic() const -> const Diagnostic& {
        return diag_;
    }

private:
    Diagnostic diag_;
};

/// Collects diagnostics for one compilation unit.
///
/// Not thread-safe; each unit owns its own sink.
class DiagnosticSink {
public:
    explicit DiagnosticSink(std::string file_name = "",
                            FailurePolicy policy = FailurePolicy::Recover);

    void add(Diagnostic diag);

    void error(std::string code, std::string message,
               std::optional<ast::SourceLocation> loc = std::nullopt);
    void warning(std::string code, std::string message,
                 std::optional<ast::SourceLocation> loc = std::nullopt);
    void info(std::string code, std::string message,
              std::optional<ast::SourceLocation> loc = std::nullopt);

    /// Reports a construct that cannot be translated. Records an error, then
    /// throws under `FailurePolicy::Abort`.
    void unsupported(std::string code, std::string message,
                     std::optional<ast::SourceLocation> loc = std::nullopt);

    [[nodiscard]] auto diagnostics() const -> const std::vector<Diagnostic>& {
        return diagnostics_;
    }

    [[nodiscard]] auto has_errors() const -> bool {
        return error_count_ > 0;
    }

    [[nodiscard]] auto error_count() const -> size_t {
        return error_count_;
    }

    [[nodiscard]] auto policy() const -> FailurePolicy {
        return policy_;
    }

    [[nodiscard]] auto file_name() const -> const std::string& {
        return file_name_;
    }

    /// Hands over everything collected so far and resets the sink.
    auto drain() -> std::vector<Diagnostic>;

private:
    std::string file_name_;
    FailurePolicy policy_;
    std::vector<Diagnostic> diagnostics_;
    size_t error_count_ = 0;
};

} // namespace pyemit::diag

#endif // PYEMIT_DIAG_DIAGNOSTICS_HPP

//! # Compilation Unit Driver
//!
//! Prints one module to one sink.
//!
//! ## Ordering
//!
//! The leading run of `import` / `from ... import` statements is printed and
//! flushed as one chunk, followed by a blank line when there was any. Every
//! remaining top-level declaration is then printed and flushed on its own,
//! with one blank line before each declaration after the first.
//!
//! ## Failure Modes
//!
//! | Situation                      | Outcome                                        |
//! |--------------------------------|------------------------------------------------|
//! | Recoverable problem            | diagnostic recorded, printing continues        |
//! | `FatalTranslationError`        | unit fails; sink holds output up to last flush |
//! | Sink write failure             | P010, unit fails                               |
//! | Cancellation requested         | P011, stops before the next declaration        |
//!
//! The printer, and with it the sink, is released on every exit path.
//! Independent units may run on separate threads as long as each has its own
//! sink, source map and diagnostic sink.

#ifndef PYEMIT_DRIVER_DRIVER_HPP
#define PYEMIT_DRIVER_DRIVER_HPP

#include "pyemit/ast/ast.hpp"
#include "pyemit/common.hpp"
#include "pyemit/diag/diagnostics.hpp"
#include "pyemit/io/writer.hpp"
#include "pyemit/printer/printer.hpp"
#include "pyemit/sourcemap/source_map.hpp"

#include <atomic>
#include <string>

namespace pyemit::driver {

/// Cooperative stop request, checked between top-level declarations.
class CancellationToken {
public:
    void cancel() {
        cancelled_.store(true, std::memory_order_release);
    }

    [[nodiscard]] auto is_cancelled() const -> bool {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

struct DriverOptions {
    printer::PrinterOptions printer;
};

struct RunResult {
    size_t imports_printed = 0;
    size_t declarations_printed = 0;
    size_t bytes_written = 0;
    bool cancelled = false;
};

/// Prints `module` to `writer`. Returns an error when the unit failed.
auto run(Box<io::Writer> writer, sourcemap::SourceMapGenerator& source_map,
         const ast::Module& module, diag::DiagnosticSink& diagnostics,
         const DriverOptions& options = {}, const CancellationToken* cancel = nullptr)
    -> Result<RunResult>;

/// Number of statements in the module's leading import run.
[[nodiscard]] auto count_leading_imports(const ast::Module& module) -> size_t;

} // namespace pyemit::driver

#endif // PYEMIT_DRIVER_DRIVER_HPP

//! # Driver Implementation

#include "pyemit/driver/driver.hpp"

#include "pyemit/log/log.hpp"
#include "pyemit/printer/print_dispatch.hpp"

namespace pyemit::driver {

namespace {

auto is_import(const ast::Stmt& stmt) -> bool {
    return stmt.is<ast::Import>() || stmt.is<ast::ImportFrom>();
}

/// Flushes, turning a sink failure into P010.
auto flush_unit(printer::Printer& printer, diag::DiagnosticSink& diagnostics) -> Result<size_t> {
    auto result = printer.flush();
    if (is_err(result)) {
        diagnostics.error(diag::codes::WRITE_FAILED, "write failed: " + unwrap_err(result));
    }
    return result;
}

} // namespace

auto count_leading_imports(const ast::Module& module) -> size_t {
    size_t count = 0;
    while (count < module.body.size() && is_import(*module.body[count])) {
        ++count;
    }
    return count;
}

auto run(Box<io::Writer> writer, sourcemap::SourceMapGenerator& source_map,
         const ast::Module& module, diag::DiagnosticSink& diagnostics,
         const DriverOptions& options, const CancellationToken* cancel) -> Result<RunResult> {
    std::string unit = diagnostics.file_name().empty() ? std::string("<unit>")
                                                     : diagnostics.file_name();
    PYEMIT_LOG_DEBUG("driver", "Printing " << unit << " (" << module.body.size()
                                           << " top-level statements)");

    printer::Printer printer(std::move(writer), source_map, options.printer);
    printer::PrintDispatch dispatch(printer, diagnostics);
    RunResult run_result;

    try {
        size_t import_count = count_leading_imports(module);

        for (size_t i = 0; i < import_count; ++i) {
            dispatch.print_stmt(*module.body[i]);
            dispatch.separator();
        }
        if (import_count > 0) {
            dispatch.newline();
        }
        dispatch.flush_locations();
        if (auto flushed = flush_unit(printer, diagnostics); is_err(flushed)) {
            return unwrap_err(flushed);
        }
        run_result.imports_printed = import_count;

        for (size_t i = import_count; i < module.body.size(); ++i) {
            if (cancel && cancel->is_cancelled()) {
                diagnostics.info(diag::codes::CANCELLED,
                                 "printing cancelled after " +
                                     std::to_string(run_result.declarations_printed) +
                                     " declarations");
                run_result.cancelled = true;
                break;
            }

            if (i > import_count) {
                dispatch.newline();
            }
            dispatch.print_stmt(*module.body[i]);
            dispatch.separator();
            dispatch.flush_locations();

            if (auto flushed = flush_unit(printer, diagnostics); is_err(flushed)) {
                return unwrap_err(flushed);
            }
            ++run_result.declarations_printed;
        }
    } catch (const diag::FatalTranslationError& e) {
        PYEMIT_LOG_ERROR("driver", "Aborting " << unit << ": " << e.what());
        return format_diagnostic(e.diagnostic());
    }

    run_result.bytes_written = printer.bytes_flushed();
    PYEMIT_LOG_DEBUG("driver", "Printed " << unit << ": " << run_result.declarations_printed
                                          << " declarations, " << run_result.bytes_written
                                          << " bytes");
    return run_result;
}

} // namespace pyemit::driver

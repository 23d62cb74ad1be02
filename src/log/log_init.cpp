//! # Log Configuration
//!
//! Turns logging-related arguments and the `PYEMIT_LOG` environment variable
//! into a LogConfig. Embedders that own their own command line pass the
//! arguments they received; everything unrelated to logging is ignored.

#include "pyemit/log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace pyemit::log {

namespace {

/// Returns the verbosity count of `-v`, `-vv`, `-vvv`, or 0 for anything else.
int verbosity_flag(std::string_view arg) {
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-')
        return 0;
    for (size_t i = 1; i < arg.size(); ++i) {
        if (arg[i] != 'v')
            return 0;
    }
    return static_cast<int>(arg.size() - 1);
}

void apply_env_fallback(LogConfig& config) {
    const char* env = std::getenv("PYEMIT_LOG");
    if (!env || *env == '\0')
        return;

    std::string value = env;
    // "printer=trace,*=warn" or "printer,emit" are filter specs; anything else is a level.
    if (value.find('=') != std::string::npos || value.find(',') != std::string::npos) {
        config.filter_spec = value;
    } else {
        config.level = parse_level(value);
    }
}

} // namespace

LogConfig parse_log_options(int argc, const char* const argv[]) {
    LogConfig config;

    bool has_level = false;
    bool has_filter = false;
    int verbosity = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg.starts_with("--log-level=")) {
            config.level = parse_level(arg.substr(12));
            has_level = true;
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = std::string(arg.substr(13));
            has_filter = true;
        } else if (arg.starts_with("--log-file=")) {
            config.log_file = std::string(arg.substr(11));
        } else if (arg.starts_with("--log-format=")) {
            auto fmt = arg.substr(13);
            config.format = (fmt == "json" || fmt == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Error;
            has_level = true;
        } else if (arg == "--verbose") {
            verbosity = std::max(verbosity, 1);
        } else {
            verbosity = std::max(verbosity, verbosity_flag(arg));
        }
    }

    // An explicit --log-level wins over -v flags.
    if (!has_level && verbosity > 0) {
        config.level = verbosity >= 3   ? LogLevel::Trace
                       : verbosity == 2 ? LogLevel::Debug
                                        : LogLevel::Info;
        has_level = true;
    }

    if (!has_level && !has_filter) {
        apply_env_fallback(config);
    }

    return config;
}

} // namespace pyemit::log

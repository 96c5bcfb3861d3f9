// options/logging.cpp
//
// Log destination, level, rotation and format.

#include <cstdint>
#include <stdexcept>
#include <string>

#include "options.hpp"
#include "parse_utils.hpp"

void parse_logging_options(Options& opts, const OptionSource& src) {
    bool ok = false;
    if (auto v = src.value("--log-file"))
        opts.logging.log_file = *v;
    if (auto v = src.value("--log-level")) {
        if (!parse_log_level(*v, opts.logging.log_level))
            throw std::runtime_error("Invalid value for --log-level");
    }
    if (auto v = src.value("--max-log-size")) {
        opts.logging.max_log_size = parse_bytes(*v, 0, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    if (auto v = src.value("--max-log-files")) {
        opts.logging.max_log_files = parse_size_t(*v, 0, 100, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-files");
    }
    opts.logging.json_log = src.flag("--json-log");
    opts.logging.compress_logs = src.flag("--compress-logs");
    opts.logging.use_syslog = src.flag("--syslog");
}

#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace siri {
namespace logging {

struct LogConfig {
    std::string log_dir;                          // e.g. <data-dir>/logs
    std::string app_name = "siri-billing";        // log file is <app_name>.log
    std::string level = "info";                   // trace, debug, info, warn, error
    size_t max_file_size = 10 * 1024 * 1024;      // rotate at 10 MB
    size_t max_files = 3;                         // rotated backups kept
    size_t viewer_capacity = 2000;                // lines retained for the in-app viewer
    bool console = true;
};

// Delete every regular file with the ".log" extension directly inside `dir`.
// A missing directory is not an error. Returns the number of files removed.
size_t clean_log_directory(const std::string& dir);

// Path of the active log file for a configuration
std::string log_file_path(const LogConfig& config);

// Clean the log directory, then install the default logger with console,
// rotating file and in-app viewer sinks. Returns the log file path.
// Falls back to console + viewer when the file cannot be opened.
std::string init(const LogConfig& config);

// Change the level of the default logger
void set_level(const std::string& level);

// Newest formatted lines held for the in-app log viewer (oldest first).
// limit == 0 returns everything retained.
std::vector<std::string> recent_lines(size_t limit = 0);

// Flush every sink of the default logger
void flush();

} // namespace logging
} // namespace siri

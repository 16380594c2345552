#include <siri/logging.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <filesystem>
#include <memory>
#include <mutex>

namespace fs = std::filesystem;

namespace siri {
namespace logging {

static std::mutex g_viewer_mutex;
static std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> g_viewer_sink;

static spdlog::level::level_enum parse_level(const std::string& level) {
    if (level == "warning" || level == "warn") {
        return spdlog::level::warn;
    }
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        return spdlog::level::info;
    }
    return parsed;
}

size_t clean_log_directory(const std::string& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return 0;
    }

    size_t removed = 0;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || it->path().extension() != ".log") {
            continue;
        }
        if (fs::remove(it->path(), entry_ec)) {
            removed++;
        }
    }

    return removed;
}

std::string log_file_path(const LogConfig& config) {
    return (fs::path(config.log_dir) / (config.app_name + ".log")).string();
}

std::string init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    auto viewer_sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(config.viewer_capacity);
    viewer_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    sinks.push_back(viewer_sink);

    std::string file_path = log_file_path(config);
    std::string file_error;
    size_t removed = 0;
    try {
        removed = clean_log_directory(config.log_dir);
        fs::create_directories(config.log_dir);
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            file_path, config.max_file_size, config.max_files));
    } catch (const std::exception& e) {
        file_error = e.what();
        file_path.clear();
    }

    auto logger = std::make_shared<spdlog::logger>(config.app_name, sinks.begin(), sinks.end());
    logger->set_level(parse_level(config.level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    {
        std::lock_guard<std::mutex> lock(g_viewer_mutex);
        g_viewer_sink = viewer_sink;
    }

    if (removed > 0) {
        spdlog::debug("[Logging] Removed {} old log file(s) from {}", removed, config.log_dir);
    }
    if (!file_error.empty()) {
        spdlog::error("[Logging] File logging disabled: {}", file_error);
    } else {
        spdlog::info("[Logging] Writing logs to {}", file_path);
    }

    return file_path;
}

void set_level(const std::string& level) {
    spdlog::set_level(parse_level(level));
}

std::vector<std::string> recent_lines(size_t limit) {
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink;
    {
        std::lock_guard<std::mutex> lock(g_viewer_mutex);
        sink = g_viewer_sink;
    }
    if (!sink) {
        return {};
    }

    std::vector<std::string> lines = sink->last_formatted(limit);
    // Formatted entries keep their line terminator
    for (auto& line : lines) {
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.pop_back();
        }
    }
    return lines;
}

void flush() {
    spdlog::default_logger()->flush();
}

} // namespace logging
} // namespace siri

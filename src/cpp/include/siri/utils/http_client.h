#pragma once

#include <string>
#include <map>
#include <functional>
#include <chrono>
#include <memory>
#include <cstddef>

namespace siri {
namespace utils {

struct HttpResponse {
    int status_code;
    std::string body;
    std::map<std::string, std::string> headers;
};

struct DownloadOptions {
    int max_retries = 2;
    int initial_retry_delay_ms = 1000;
    long connect_timeout = 30;
    long low_speed_limit = 1024;   // bytes/sec
    long low_speed_time = 60;      // seconds below the limit before aborting
};

struct DownloadResult {
    bool success = false;
    size_t bytes_downloaded = 0;
    size_t total_bytes = 0;
    long http_code = 0;
    int curl_code = 0;
    std::string error_message;
};

using ProgressCallback = std::function<void(size_t downloaded, size_t total)>;

class HttpClient {
public:
    // Simple GET request. Throws NetworkException on transport failure.
    static HttpResponse get(const std::string& url,
                           const std::map<std::string, std::string>& headers = {},
                           long timeout_seconds = 30);

    // Download file to disk (written to <output_path>.partial, then renamed)
    static DownloadResult download_file(const std::string& url,
                                        const std::string& output_path,
                                        ProgressCallback callback = nullptr,
                                        const std::map<std::string, std::string>& headers = {},
                                        const DownloadOptions& options = DownloadOptions());

    // Check if URL answers with HTTP 200
    static bool is_reachable(const std::string& url, int timeout_seconds = 5);

private:
    static DownloadResult download_attempt(const std::string& url,
                                           const std::string& output_path,
                                           ProgressCallback callback,
                                           const std::map<std::string, std::string>& headers,
                                           const DownloadOptions& options);
};

// Returns a callback that hands progress to `report` at most once per
// second, plus once more when the transfer completes.
inline ProgressCallback create_throttled_progress_callback(std::function<void(size_t, size_t)> report) {
    auto last_report_time = std::make_shared<std::chrono::steady_clock::time_point>(
        std::chrono::steady_clock::now());
    auto reported_final = std::make_shared<bool>(false);

    return [report, last_report_time, reported_final](size_t current, size_t total) {
        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            now - *last_report_time);

        bool is_complete = (total > 0 && current >= total);
        if (is_complete && *reported_final) {
            return;
        }

        if (elapsed.count() >= 1000 || is_complete) {
            report(current, total);
            *last_report_time = now;
            if (is_complete) {
                *reported_final = true;
            }
        }
    };
}

} // namespace utils
} // namespace siri

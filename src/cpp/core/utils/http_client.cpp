#include <siri/utils/http_client.h>
#include <siri/error_types.h>
#include <spdlog/spdlog.h>
#include <curl/curl.h>
#include <cstdio>
#include <thread>
#include <chrono>
#include <filesystem>
#include <memory>

namespace fs = std::filesystem;

namespace siri {
namespace utils {

static constexpr const char* USER_AGENT = "siri-billing-desktop/1.0";

// Callback for writing response data to string
static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* str = static_cast<std::string*>(userp);
    str->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// Callback for writing to file
static size_t write_file_callback(void* ptr, size_t size, size_t nmemb, void* stream) {
    return fwrite(ptr, size, nmemb, static_cast<FILE*>(stream));
}

struct ProgressData {
    ProgressCallback callback;
};

static int progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                             curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    ProgressData* data = static_cast<ProgressData*>(clientp);
    if (data && data->callback && dlnow > 0) {
        data->callback(static_cast<size_t>(dlnow), dltotal > 0 ? static_cast<size_t>(dltotal) : 0);
    }
    return 0;
}

namespace {

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

struct FileCloser {
    void operator()(FILE* fp) const { fclose(fp); }
};

using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;
using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;
using FilePtr = std::unique_ptr<FILE, FileCloser>;

// Easy handle with the options every request shares
CurlPtr make_request(const std::string& url, long timeout_seconds) {
    CurlPtr curl(curl_easy_init());
    if (curl) {
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, USER_AGENT);
    }
    return curl;
}

SlistPtr attach_headers(CURL* curl, const std::map<std::string, std::string>& headers) {
    curl_slist* list = nullptr;
    for (const auto& [name, value] : headers) {
        list = curl_slist_append(list, (name + ": " + value).c_str());
    }
    if (list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
    }
    return SlistPtr(list);
}

long response_code_of(CURL* curl) {
    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    return code;
}

} // namespace

HttpResponse HttpClient::get(const std::string& url,
                             const std::map<std::string, std::string>& headers,
                             long timeout_seconds) {
    CurlPtr curl = make_request(url, timeout_seconds);
    if (!curl) {
        throw NetworkException("failed to initialize CURL");
    }

    HttpResponse response;
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    SlistPtr header_list = attach_headers(curl.get(), headers);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw NetworkException(std::string(curl_easy_strerror(res)) + " (" + url + ")");
    }

    response.status_code = static_cast<int>(response_code_of(curl.get()));
    spdlog::debug("[Http] GET {} -> {}", url, response.status_code);
    return response;
}

DownloadResult HttpClient::download_attempt(const std::string& url,
                                            const std::string& output_path,
                                            ProgressCallback callback,
                                            const std::map<std::string, std::string>& headers,
                                            const DownloadOptions& options) {
    DownloadResult result;

    // No overall timeout: large installers are bounded by the low-speed limit instead
    CurlPtr curl = make_request(url, 0L);
    if (!curl) {
        result.error_message = "Failed to initialize CURL";
        return result;
    }

    FilePtr fp(fopen(output_path.c_str(), "wb"));
    if (!fp) {
        result.error_message = "Failed to open file for writing: " + output_path;
        return result;
    }

    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_file_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, fp.get());
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options.connect_timeout);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, options.low_speed_limit);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, options.low_speed_time);

    ProgressData prog_data{callback};
    if (callback) {
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &prog_data);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    }
    SlistPtr header_list = attach_headers(curl.get(), headers);

    CURLcode res = curl_easy_perform(curl.get());
    fp.reset();

    curl_off_t downloaded = 0;
    curl_off_t total = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_SIZE_DOWNLOAD_T, &downloaded);
    curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &total);
    result.http_code = response_code_of(curl.get());
    result.bytes_downloaded = static_cast<size_t>(downloaded);
    result.total_bytes = (total > 0) ? static_cast<size_t>(total) : 0;
    result.curl_code = static_cast<int>(res);

    if (res != CURLE_OK) {
        result.error_message = std::string(curl_easy_strerror(res)) +
                               " (CURL code: " + std::to_string(result.curl_code) + ")";
    } else if (result.http_code >= 400) {
        result.error_message = "HTTP " + std::to_string(result.http_code) + " for " + url;
    } else {
        result.success = true;
    }
    return result;
}

DownloadResult HttpClient::download_file(const std::string& url,
                                         const std::string& output_path,
                                         ProgressCallback callback,
                                         const std::map<std::string, std::string>& headers,
                                         const DownloadOptions& options) {
    const std::string partial_path = output_path + ".partial";
    int retry_delay_ms = options.initial_retry_delay_ms;
    DownloadResult result;

    for (int attempt = 0; attempt <= options.max_retries; ++attempt) {
        if (attempt > 0) {
            spdlog::warn("[Http] Download retry {}/{} in {}ms: {}",
                         attempt, options.max_retries, retry_delay_ms, result.error_message);
            std::this_thread::sleep_for(std::chrono::milliseconds(retry_delay_ms));
            retry_delay_ms *= 2;
        }

        result = download_attempt(url, partial_path, callback, headers, options);
        if (result.success) {
            break;
        }
        // 4xx answers are final
        if (result.http_code >= 400 && result.http_code < 500) {
            break;
        }
    }

    std::error_code ec;
    if (!result.success) {
        fs::remove(partial_path, ec);
        return result;
    }

    fs::rename(partial_path, output_path, ec);
    if (ec) {
        // Cross-device temp directories cannot be renamed into place
        fs::copy_file(partial_path, output_path, fs::copy_options::overwrite_existing, ec);
        std::error_code remove_ec;
        fs::remove(partial_path, remove_ec);
    }
    if (ec) {
        result.success = false;
        result.error_message = "Could not move download into place: " + ec.message();
    }
    return result;
}

bool HttpClient::is_reachable(const std::string& url, int timeout_seconds) {
    CurlPtr curl = make_request(url, static_cast<long>(timeout_seconds));
    if (!curl) {
        return false;
    }

    std::string discarded;
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &discarded);

    if (curl_easy_perform(curl.get()) != CURLE_OK) {
        return false;
    }
    return response_code_of(curl.get()) == 200;
}

} // namespace utils
} // namespace siri

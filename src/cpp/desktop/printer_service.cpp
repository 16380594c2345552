#include "siri_desktop/printer_service.h"
#include <siri/error_types.h>
#include <siri/utils/process_manager.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace siri_desktop {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

fs::path unique_temp_file() {
    static std::atomic<unsigned> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    std::string name = "siri-billing-print-" + std::to_string(stamp) + "-" +
                       std::to_string(counter++) + ".txt";
    return fs::temp_directory_path() / name;
}

} // namespace

CommandResult SystemCommandRunner::run(const std::string& executable,
                                       const std::vector<std::string>& args) {
    CommandResult result;
    std::string output;
    result.exit_code = siri::utils::ProcessManager::run_process_with_output(
        executable, args,
        [&output](const std::string& line) {
            output += line;
            output += '\n';
            return true;
        },
        "", timeout_seconds_);
    result.output = std::move(output);
    return result;
}

std::vector<std::string> parse_printer_list(const std::string& output) {
    std::vector<std::string> printers;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        std::string name = trim(line);
        if (name.empty() || name == "Name") {
            continue;
        }
        printers.push_back(name);
    }
    return printers;
}

std::string quote_powershell(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

PrinterService::PrinterService(std::shared_ptr<CommandRunner> runner, bool printing_supported)
    : runner_(std::move(runner))
    , printing_supported_(printing_supported)
{
}

bool PrinterService::is_platform_supported() {
#ifdef _WIN32
    return true;
#else
    return false;
#endif
}

void PrinterService::require_supported(const char* operation) const {
    if (!printing_supported_) {
#if defined(_WIN32)
        const char* platform = "this system";
#elif defined(__APPLE__)
        const char* platform = "macOS";
#else
        const char* platform = "Linux";
#endif
        spdlog::warn("[Printer] {} requested, but printing is only supported on Windows", operation);
        throw siri::UnsupportedOperationException("Printing", platform);
    }
}

std::vector<std::string> PrinterService::list_printers() {
    require_supported("list_printers");

    std::string primary_error;
    try {
        auto result = runner_->run("powershell", {
            "-NoProfile", "-Command",
            "Get-CimInstance Win32_Printer | Select-Object -ExpandProperty Name"
        });
        if (result.exit_code == 0) {
            auto printers = parse_printer_list(result.output);
            if (!printers.empty()) {
                spdlog::debug("[Printer] Found {} printer(s) via CIM", printers.size());
                return printers;
            }
            primary_error = "no printers reported";
        } else {
            primary_error = "exit code " + std::to_string(result.exit_code);
        }
    } catch (const siri::ShellException& e) {
        primary_error = e.what();
    }

    spdlog::warn("[Printer] Printer query failed ({}), falling back to wmic", primary_error);

    std::string fallback_error;
    try {
        auto result = runner_->run("wmic", {"printer", "get", "name"});
        if (result.exit_code == 0) {
            auto printers = parse_printer_list(result.output);
            spdlog::debug("[Printer] Found {} printer(s) via wmic", printers.size());
            return printers;
        }
        fallback_error = "exit code " + std::to_string(result.exit_code);
    } catch (const siri::ShellException& e) {
        fallback_error = e.what();
    }

    throw siri::PrinterException("Failed to list printers: " + primary_error +
                                 "; fallback failed: " + fallback_error);
}

void PrinterService::print_text(const std::string& content, const std::string& printer_name) {
    require_supported("print_text");

    fs::path temp = unique_temp_file();
    {
        std::ofstream out(temp, std::ios::binary);
        if (!out) {
            throw siri::PrinterException("Failed to create temporary file " + temp.string());
        }
        out << content;
        if (!out) {
            std::error_code ec;
            fs::remove(temp, ec);
            throw siri::PrinterException("Failed to write temporary file " + temp.string());
        }
    }

    std::string script = "Get-Content -Path " + quote_powershell(temp.string()) + " | Out-Printer";
    if (!printer_name.empty()) {
        script += " -Name " + quote_powershell(printer_name);
    }

    spdlog::info("[Printer] Printing {} bytes to {}", content.size(),
                 printer_name.empty() ? std::string("default printer") : printer_name);

    CommandResult result;
    std::string launch_error;
    try {
        result = runner_->run("powershell", {"-NoProfile", "-Command", script});
    } catch (const siri::ShellException& e) {
        launch_error = e.what();
    }

    std::error_code ec;
    fs::remove(temp, ec);
    if (ec) {
        spdlog::debug("[Printer] Could not remove {}: {}", temp.string(), ec.message());
    }

    if (!launch_error.empty()) {
        throw siri::PrinterException("Failed to print: " + launch_error);
    }
    if (result.exit_code != 0) {
        std::string detail = trim(result.output);
        throw siri::PrinterException("Printing failed with exit code " + std::to_string(result.exit_code) +
                                     (detail.empty() ? "" : ": " + detail));
    }
}

} // namespace siri_desktop

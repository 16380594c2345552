#include "siri_desktop/app_config.h"
#include <siri/utils/path_utils.h>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace siri_desktop {

std::string AppConfig::log_dir() const {
    std::string base = data_dir.empty() ? siri::utils::get_app_data_dir(app_name) : data_dir;
    return (fs::path(base) / "logs").string();
}

void load_env_defaults(AppConfig& config) {
    auto getenv_or_default = [](const char* name, const std::string& default_val) -> std::string {
        const char* val = std::getenv(name);
        return (val && *val) ? std::string(val) : default_val;
    };

    auto getenv_int_or_default = [](const char* name, int default_val) -> int {
        const char* val = std::getenv(name);
        if (!val || !*val) {
            return default_val;
        }
        try {
            return std::stoi(val);
        } catch (const std::logic_error&) {
            return default_val;
        }
    };

    auto getenv_bool_or_default = [](const char* name, bool default_val) -> bool {
        const char* val = std::getenv(name);
        if (!val || !*val) {
            return default_val;
        }
        std::string v(val);
        if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
        if (v == "0" || v == "false" || v == "no" || v == "off") return false;
        return default_val;
    };

    config.data_dir = getenv_or_default("SIRI_DATA_DIR", config.data_dir);
    config.sidecar_binary = getenv_or_default("SIRI_SIDECAR_BINARY", config.sidecar_binary);
    config.sidecar_working_dir = getenv_or_default("SIRI_SIDECAR_DIR", config.sidecar_working_dir);
    config.shutdown_host = getenv_or_default("SIRI_BACKEND_HOST", config.shutdown_host);
    config.shutdown_port = getenv_int_or_default("SIRI_BACKEND_PORT", config.shutdown_port);
    config.shutdown_timeout_seconds = getenv_int_or_default("SIRI_SHUTDOWN_TIMEOUT",
                                                            config.shutdown_timeout_seconds);
    config.grace_period_ms = getenv_int_or_default("SIRI_GRACE_PERIOD_MS", config.grace_period_ms);
    config.log_level = getenv_or_default("SIRI_LOG_LEVEL", config.log_level);
    config.frontend_url = getenv_or_default("SIRI_FRONTEND_URL", config.frontend_url);
    config.bridge_port = getenv_int_or_default("SIRI_BRIDGE_PORT", config.bridge_port);
    config.update_manifest_url = getenv_or_default("SIRI_UPDATE_URL", config.update_manifest_url);
    config.update_public_key = getenv_or_default("SIRI_UPDATE_PUBKEY", config.update_public_key);
    config.headless = getenv_bool_or_default("SIRI_HEADLESS", config.headless);
}

ConfigParser::ConfigParser(AppConfig defaults)
    : app_("siri-billing - Siri Billing desktop application")
    , config_(std::move(defaults))
{
    load_env_defaults(config_);

    app_.add_flag("-v,--version", config_.show_version, "Show version number");

    app_.add_option("--data-dir", config_.data_dir, "Directory for logs and application data")
        ->capture_default_str();

    app_.add_option("--sidecar", config_.sidecar_binary, "Path to the backend executable")
        ->check(CLI::ExistingFile);

    app_.add_option("--sidecar-dir", config_.sidecar_working_dir, "Working directory for the backend");

    app_.add_option("--sidecar-arg", config_.sidecar_args, "Extra argument passed to the backend (repeatable)");

    app_.add_option("--backend-host", config_.shutdown_host, "Host the backend listens on")
        ->capture_default_str();

    app_.add_option("--backend-port", config_.shutdown_port, "Port the backend listens on")
        ->check(CLI::Range(1, 65535))
        ->capture_default_str();

    app_.add_option("--shutdown-timeout", config_.shutdown_timeout_seconds,
                    "Timeout in seconds for the shutdown request")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    app_.add_option("--grace-period", config_.grace_period_ms,
                    "Milliseconds to wait for the backend to exit before killing it")
        ->check(CLI::NonNegativeNumber)
        ->capture_default_str();

    app_.add_flag("--end-grace-on-exit", config_.end_grace_on_exit,
                  "Stop waiting as soon as the backend exits");

    app_.add_option("--log-level", config_.log_level, "Log level")
        ->check(CLI::IsMember({"critical", "error", "warning", "warn", "info", "debug", "trace"}))
        ->capture_default_str();

    app_.add_option("--frontend-url", config_.frontend_url, "URL of the user interface")
        ->capture_default_str();

    app_.add_option("--bridge-port", config_.bridge_port, "Loopback port for native commands")
        ->check(CLI::Range(1, 65535))
        ->capture_default_str();

    app_.add_option("--update-url", config_.update_manifest_url, "Update manifest URL")
        ->capture_default_str();

    app_.add_option("--update-pubkey", config_.update_public_key,
                    "minisign public key that update artifacts must be signed with");

    app_.add_flag("--headless", config_.headless, "Do not open the user interface");
}

int ConfigParser::parse(int argc, char** argv) {
    try {
        app_.parse(argc, argv);
        should_continue_ = true;
        exit_code_ = 0;
        return 0;
    } catch (const CLI::ParseError& e) {
        // --help or a parse error; CLI11 prints either
        exit_code_ = app_.exit(e);
        should_continue_ = false;
        return exit_code_;
    }
}

} // namespace siri_desktop

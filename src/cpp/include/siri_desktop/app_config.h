#pragma once

#include <CLI/CLI.hpp>
#include <siri/version.h>
#include <string>
#include <vector>
#include <cstddef>

namespace siri_desktop {

struct AppConfig {
    std::string app_name = "siri-billing";
    std::string data_dir;                       // empty: platform application-data directory

    // Backend sidecar
    std::string sidecar_name = "siri-billing-backend";
    std::string sidecar_binary;                 // explicit path, skips the search
    std::string sidecar_working_dir;
    std::vector<std::string> sidecar_args;

    // Graceful shutdown
    std::string shutdown_host = "localhost";
    int shutdown_port = 8080;
    std::string shutdown_path = "/api/shutdown";
    int shutdown_timeout_seconds = 5;
    int grace_period_ms = 5000;
    bool end_grace_on_exit = false;

    // Logging
    std::string log_level = "info";
    std::size_t log_max_size = 10 * 1024 * 1024;

    // Front end and native commands
    std::string frontend_url = "http://localhost:1420";
    int bridge_port = 1421;
    std::string update_manifest_url = SIRI_DEFAULT_UPDATE_URL;
    std::string update_public_key = SIRI_UPDATE_PUBLIC_KEY;   // minisign key for update artifacts

    bool headless = false;
    bool show_version = false;

    std::string log_dir() const;
};

// Fill config fields from SIRI_* environment variables. Invalid numbers are ignored.
void load_env_defaults(AppConfig& config);

class ConfigParser {
public:
    // Environment defaults are applied before the command line is parsed
    explicit ConfigParser(AppConfig defaults = AppConfig());

    // Returns 0 if the application should continue. Otherwise should_continue()
    // is false and the return value is the exit code (0 for --help).
    int parse(int argc, char** argv);

    const AppConfig& get_config() const { return config_; }
    bool should_continue() const { return should_continue_; }
    int get_exit_code() const { return exit_code_; }

private:
    CLI::App app_;
    AppConfig config_;
    bool should_continue_ = true;
    int exit_code_ = 0;
};

} // namespace siri_desktop

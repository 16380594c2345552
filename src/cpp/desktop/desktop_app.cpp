#include "siri_desktop/desktop_app.h"
#include <siri/error_types.h>
#include <siri/logging.h>
#include <siri/single_instance.h>
#include <siri/utils/http_client.h>
#include <siri/version.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <iostream>

#ifdef _WIN32
#include <windows.h>
#else
#include <csignal>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/select.h>
#include <unistd.h>
#endif

namespace siri_desktop {

namespace {

constexpr const char* kWindowTitle = "Siri Billing";
constexpr int kReadinessTimeoutSeconds = 30;

DesktopApp* g_app_instance = nullptr;

} // namespace

#ifdef _WIN32
BOOL WINAPI console_ctrl_handler(DWORD ctrl_type) {
    if (ctrl_type == CTRL_C_EVENT || ctrl_type == CTRL_BREAK_EVENT || ctrl_type == CTRL_CLOSE_EVENT) {
        if (g_app_instance) {
            g_app_instance->handle_interrupt();
        }
        return TRUE;
    }
    return FALSE;
}
#else
int DesktopApp::signal_pipe_[2] = {-1, -1};

// Only async-signal-safe work here: wake the monitor thread
void signal_handler(int signal) {
    char sig = static_cast<char>(signal);
    ssize_t written = write(DesktopApp::signal_pipe_[1], &sig, 1);
    (void)written;
}
#endif

DesktopApp::DesktopApp(int argc, char* argv[]) {
    parse_result_ = parser_.parse(argc, argv);
    config_ = parser_.get_config();
}

DesktopApp::~DesktopApp() {
#ifndef _WIN32
    stop_signal_monitor();
#endif
    stop_readiness_probe();

    if (bridge_) {
        bridge_->stop();
    }
    if (sidecar_) {
        sidecar_->final_cleanup();
    }

#ifndef _WIN32
    if (signal_pipe_[0] != -1) {
        close(signal_pipe_[0]);
        close(signal_pipe_[1]);
        signal_pipe_[0] = signal_pipe_[1] = -1;
    }
#endif

    g_app_instance = nullptr;
}

void DesktopApp::print_version() {
    std::cout << "siri-billing version " << SIRI_VERSION_STRING << std::endl;
}

int DesktopApp::run() {
    if (!parser_.should_continue()) {
        return parser_.get_exit_code();
    }
    if (config_.show_version) {
        print_version();
        return 0;
    }

    if (!setup_logging()) {
        return 1;
    }

    spdlog::info("[App] Siri Billing {} starting", SIRI_VERSION_STRING);

    // The backend listens on a fixed port, so a second copy cannot work
    instance_lock_ = siri::SingleInstance::acquire(config_.app_name);
    if (!instance_lock_) {
        spdlog::error("[App] Another instance of Siri Billing is already running");
        std::cerr << "Error: Another instance of Siri Billing is already running" << std::endl;
        return 1;
    }

    install_signal_handlers();

    if (start_sidecar()) {
        start_readiness_probe();
    }

    if (!start_command_bridge()) {
        spdlog::warn("[App] Native commands are unavailable for this session");
    }

    {
        std::lock_guard<std::mutex> lock(window_mutex_);
        window_ = create_window(!config_.headless);
    }
    if (!window_ || !window_->initialize(kWindowTitle, config_.frontend_url)) {
        spdlog::critical("[App] Failed to create the main window");
        std::cerr << "Error: Failed to create the main window" << std::endl;
        siri::logging::flush();
        return 1;
    }
    window_->set_event_callback([this](const WindowEvent& event) { on_window_event(event); });

#ifndef _WIN32
    start_signal_monitor();
#endif

    spdlog::debug("[App] Entering window event loop");
    window_->run();
    spdlog::debug("[App] Window event loop exited");

#ifndef _WIN32
    stop_signal_monitor();
#endif
    stop_readiness_probe();
    if (bridge_) {
        bridge_->stop();
    }
    if (sidecar_) {
        sidecar_->final_cleanup();
    }

    spdlog::info("[App] Goodbye");
    siri::logging::flush();
    return 0;
}

void DesktopApp::request_close() {
    std::lock_guard<std::mutex> lock(window_mutex_);
    if (window_) {
        window_->request_close();
    }
}

void DesktopApp::handle_interrupt() {
    if (++interrupt_count_ == 1) {
        spdlog::info("[App] Received interrupt signal, closing");
        request_close();
        return;
    }

    // Already closing: stop waiting on the backend
    spdlog::warn("[App] Received another interrupt signal, terminating the backend now");
    if (sidecar_) {
        sidecar_->skip_grace_period();
    }
}

bool DesktopApp::setup_logging() {
    siri::logging::LogConfig log_config;
    log_config.log_dir = config_.log_dir();
    log_config.app_name = config_.app_name;
    log_config.level = config_.log_level;
    log_config.max_file_size = config_.log_max_size;

    try {
        std::string path = siri::logging::init(log_config);
        spdlog::debug("[App] Logging to {}", path);
        return true;
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Error: Failed to initialize logging: " << e.what() << std::endl;
        return false;
    }
}

bool DesktopApp::start_sidecar() {
    SidecarOptions options;
    options.sidecar_name = config_.sidecar_name;
    options.binary_path = config_.sidecar_binary;
    options.args = config_.sidecar_args;
    options.working_dir = config_.sidecar_working_dir;
    options.grace_period = std::chrono::milliseconds(config_.grace_period_ms);
    options.end_grace_on_exit = config_.end_grace_on_exit;

    ShutdownEndpoint endpoint;
    endpoint.host = config_.shutdown_host;
    endpoint.port = config_.shutdown_port;
    endpoint.path = config_.shutdown_path;
    endpoint.timeout_seconds = config_.shutdown_timeout_seconds;

    sidecar_ = std::make_unique<SidecarManager>(
        options,
        std::make_shared<SystemProcessHost>(),
        std::make_shared<SystemProcessTerminator>(),
        std::make_shared<HttpShutdownRequester>(endpoint));

    return sidecar_->start();
}

void DesktopApp::start_readiness_probe() {
    std::string url = "http://" + config_.shutdown_host + ":" + std::to_string(config_.shutdown_port) + "/health";
    stop_probe_ = false;

    probe_thread_ = std::thread([this, url]() {
        auto start = std::chrono::steady_clock::now();
        auto deadline = start + std::chrono::seconds(kReadinessTimeoutSeconds);

        while (!stop_probe_ && std::chrono::steady_clock::now() < deadline) {
            if (siri::utils::HttpClient::is_reachable(url, 1)) {
                auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start);
                spdlog::info("[App] Backend ready after {} ms", elapsed.count());
                return;
            }
            std::unique_lock<std::mutex> lock(probe_mutex_);
            probe_cv_.wait_for(lock, std::chrono::milliseconds(500), [this]() { return stop_probe_.load(); });
        }

        if (!stop_probe_) {
            spdlog::warn("[App] Backend did not answer {} within {} seconds", url, kReadinessTimeoutSeconds);
        }
    });
}

void DesktopApp::stop_readiness_probe() {
    {
        std::lock_guard<std::mutex> lock(probe_mutex_);
        stop_probe_ = true;
    }
    probe_cv_.notify_all();
    if (probe_thread_.joinable()) {
        probe_thread_.join();
    }
}

bool DesktopApp::start_command_bridge() {
    updater_ = std::make_unique<Updater>(config_.update_manifest_url, SIRI_VERSION_STRING);
    updater_->set_public_key(config_.update_public_key);
    printers_ = std::make_unique<PrinterService>(std::make_shared<SystemCommandRunner>());

    auto registry = std::make_shared<CommandRegistry>();
    register_commands(*registry);

    bridge_ = std::make_unique<CommandBridge>(registry, "127.0.0.1", config_.bridge_port,
                                              config_.frontend_url);
    return bridge_->start();
}

void DesktopApp::register_commands(CommandRegistry& registry) {
    registry.add("app_version", [](const json&) -> json {
        return SIRI_VERSION_STRING;
    });

    registry.add("check_for_updates", [this](const json&) -> json {
        return updater_->check_for_updates();
    });

    registry.add("install_update", [this](const json&) -> json {
        return updater_->install_update();
    });

    registry.add("list_printers", [this](const json&) -> json {
        return printers_->list_printers();
    });

    registry.add("print_text", [this](const json& args) -> json {
        if (!args.contains("content") || !args["content"].is_string()) {
            throw siri::InvalidRequestException("'content' must be a string");
        }
        std::string printer;
        if (args.contains("printer_name") && !args["printer_name"].is_null()) {
            if (!args["printer_name"].is_string()) {
                throw siri::InvalidRequestException("'printer_name' must be a string");
            }
            printer = args["printer_name"].get<std::string>();
        }
        printers_->print_text(args["content"].get<std::string>(), printer);
        return "Printed successfully";
    });

    registry.add("get_logs", [](const json& args) -> json {
        size_t limit = 0;
        if (args.contains("lines")) {
            if (!args["lines"].is_number_unsigned()) {
                throw siri::InvalidRequestException("'lines' must be a non-negative integer");
            }
            limit = args["lines"].get<size_t>();
        }
        return siri::logging::recent_lines(limit);
    });
}

void DesktopApp::install_signal_handlers() {
    g_app_instance = this;

#ifdef _WIN32
    SetConsoleCtrlHandler(console_ctrl_handler, TRUE);
#else
    if (pipe(signal_pipe_) == -1) {
        spdlog::warn("[App] Failed to create signal pipe: {}", strerror(errno));
        return;
    }

    // A full pipe must never block the signal handler
    int flags = fcntl(signal_pipe_[1], F_GETFL);
    if (flags != -1) {
        fcntl(signal_pipe_[1], F_SETFL, flags | O_NONBLOCK);
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
#endif

    spdlog::debug("[App] Signal handlers installed");
}

#ifndef _WIN32
void DesktopApp::start_signal_monitor() {
    if (signal_pipe_[0] == -1) {
        return;
    }

    stop_signal_monitor_ = false;
    signal_monitor_thread_ = std::thread([this]() {
        while (!stop_signal_monitor_) {
            fd_set readfds;
            FD_ZERO(&readfds);
            FD_SET(signal_pipe_[0], &readfds);

            struct timeval tv = {0, 100000};  // 100ms
            int result = select(signal_pipe_[0] + 1, &readfds, nullptr, nullptr, &tv);

            if (result > 0 && FD_ISSET(signal_pipe_[0], &readfds)) {
                char sig;
                ssize_t bytes_read = read(signal_pipe_[0], &sig, 1);
                (void)bytes_read;

                handle_interrupt();
            }
        }
    });
}

void DesktopApp::stop_signal_monitor() {
    stop_signal_monitor_ = true;
    if (signal_monitor_thread_.joinable()) {
        signal_monitor_thread_.join();
    }
}
#endif

void DesktopApp::on_window_event(const WindowEvent& event) {
    switch (event.kind) {
        case WindowEventKind::CLOSE_REQUESTED:
            spdlog::info("[App] Main window close requested");
            stop_readiness_probe();
            if (sidecar_) {
                sidecar_->graceful_shutdown();
            }
            break;
        case WindowEventKind::FOCUSED:
            spdlog::debug("[App] Main window focus changed: {}", event.focused);
            break;
        case WindowEventKind::EXIT_REQUESTED:
            spdlog::info("[App] Exit requested");
            break;
        case WindowEventKind::EXIT:
            if (sidecar_) {
                sidecar_->final_cleanup();
            }
            break;
    }
}

} // namespace siri_desktop

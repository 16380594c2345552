#pragma once

#include "siri_desktop/app_config.h"
#include "siri_desktop/command_bridge.h"
#include "siri_desktop/platform/window_interface.h"
#include "siri_desktop/printer_service.h"
#include "siri_desktop/sidecar_manager.h"
#include "siri_desktop/updater.h"
#include <siri/single_instance.h>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace siri_desktop {

class DesktopApp {
public:
    DesktopApp(int argc, char* argv[]);
    ~DesktopApp();

    int run();

    // Ask the main window to close (safe from any thread, not from a signal handler)
    void request_close();

    // SIGINT/SIGTERM/Ctrl+C: the first closes the window, later ones skip
    // the backend's grace period
    void handle_interrupt();

#ifndef _WIN32
    static int signal_pipe_[2];
#endif

private:
    bool setup_logging();
    void print_version();

    bool start_sidecar();
    void start_readiness_probe();
    void stop_readiness_probe();
    bool start_command_bridge();
    void register_commands(CommandRegistry& registry);

    void install_signal_handlers();
    void start_signal_monitor();
    void stop_signal_monitor();

    void on_window_event(const WindowEvent& event);

    ConfigParser parser_;
    AppConfig config_;
    int parse_result_ = 0;

    std::unique_ptr<siri::SingleInstance> instance_lock_;

    std::unique_ptr<SidecarManager> sidecar_;
    std::unique_ptr<Updater> updater_;
    std::unique_ptr<PrinterService> printers_;
    std::unique_ptr<CommandBridge> bridge_;
    std::unique_ptr<WindowInterface> window_;
    std::mutex window_mutex_;

    std::thread probe_thread_;
    std::atomic<bool> stop_probe_{false};
    std::mutex probe_mutex_;
    std::condition_variable probe_cv_;

    std::atomic<int> interrupt_count_{0};

#ifndef _WIN32
    std::thread signal_monitor_thread_;
    std::atomic<bool> stop_signal_monitor_{false};
#endif
};

} // namespace siri_desktop

#pragma once

#include "siri_desktop/sidecar_slot.h"
#include "siri_desktop/process_host.h"
#include "siri_desktop/shutdown_requester.h"
#include <siri/utils/process_manager.h>
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <chrono>

namespace siri_desktop {

struct SidecarOptions {
    std::string sidecar_name = "siri-billing-backend";
    std::string binary_path;                       // empty: locate by sidecar_name
    std::vector<std::string> args;
    std::string working_dir;
    std::chrono::milliseconds grace_period{5000};
    bool end_grace_on_exit = false;                // stop waiting as soon as the process exits
};

// Owns the backend process for the application's lifetime: spawns it,
// relays its output into the log and terminates it exactly once from
// either the window-close or the application-exit path.
class SidecarManager {
public:
    SidecarManager(SidecarOptions options,
                   std::shared_ptr<ProcessHost> host,
                   std::shared_ptr<ProcessTerminator> terminator,
                   std::shared_ptr<ShutdownRequester> requester);
    ~SidecarManager();

    SidecarManager(const SidecarManager&) = delete;
    SidecarManager& operator=(const SidecarManager&) = delete;

    // spawn() + store() + relay_output(). Returns false if the backend could
    // not be started; the failure has already been logged.
    bool start();

    // Start the backend; empty on failure (logged, never thrown)
    std::optional<siri::utils::SpawnedProcess> spawn();

    // Place the handle in the shared slot. Returns false if one is already stored.
    bool store(SidecarHandle handle);

    // Consume the event stream on a background thread until it ends
    void relay_output(std::shared_ptr<siri::utils::ProcessEventChannel> events);

    // Window close: ask the backend to exit, wait the grace period, then
    // force-terminate whatever is still registered. Blocks the caller.
    void graceful_shutdown();

    // Application exit: force-terminate the backend if still registered
    void final_cleanup();

    // End the current or next grace wait immediately, so graceful_shutdown()
    // proceeds straight to termination. Safe from any thread.
    void skip_grace_period();

    // Block until the relay thread has drained the event stream
    void wait_for_output_end();

    bool is_running() const { return slot_->is_present(); }
    std::optional<int> process_id() const { return slot_->peek_id(); }

    const SidecarOptions& options() const { return options_; }

private:
    std::string resolve_binary() const;
    void relay_loop(std::shared_ptr<siri::utils::ProcessEventChannel> events);
    void wait_grace_period();
    bool terminate_if_present(const char* reason);

    SidecarOptions options_;
    std::shared_ptr<ProcessHost> host_;
    std::shared_ptr<ProcessTerminator> terminator_;
    std::shared_ptr<ShutdownRequester> requester_;
    std::shared_ptr<SidecarSlot> slot_;

    std::thread relay_thread_;
    std::shared_ptr<siri::utils::ProcessEventChannel> relay_events_;
    std::atomic<bool> stopping_{false};

    std::mutex exit_mutex_;
    std::condition_variable exit_cv_;
    bool process_exited_ = false;
    bool skip_grace_ = false;
};

} // namespace siri_desktop

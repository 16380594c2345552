#include "siri_desktop/sidecar_manager.h"
#include <siri/error_types.h>
#include <siri/utils/path_utils.h>
#include <spdlog/spdlog.h>
#include <exception>

namespace siri_desktop {

using siri::utils::ProcessEvent;
using siri::utils::ProcessEventChannel;
using siri::utils::ProcessEventKind;
using siri::utils::SpawnedProcess;

SidecarManager::SidecarManager(SidecarOptions options,
                               std::shared_ptr<ProcessHost> host,
                               std::shared_ptr<ProcessTerminator> terminator,
                               std::shared_ptr<ShutdownRequester> requester)
    : options_(std::move(options))
    , host_(std::move(host))
    , terminator_(std::move(terminator))
    , requester_(std::move(requester))
    , slot_(std::make_shared<SidecarSlot>())
{
}

SidecarManager::~SidecarManager() {
    // Termination is the job of final_cleanup(); here we only stop listening
    stopping_ = true;
    if (relay_events_) {
        relay_events_->close();
    }
    if (relay_thread_.joinable()) {
        relay_thread_.join();
    }
}

bool SidecarManager::start() {
    auto spawned = spawn();
    if (!spawned) {
        return false;
    }

    auto events = spawned->events;
    if (!store(SidecarHandle(spawned->handle))) {
        spdlog::error("[Sidecar] A backend is already registered; terminating the new PID {}",
                      spawned->handle.pid);
        terminator_->terminate_process_tree(spawned->handle.pid);
        return false;
    }

    relay_output(events);
    return true;
}

std::string SidecarManager::resolve_binary() const {
    if (!options_.binary_path.empty()) {
        return options_.binary_path;
    }
    return siri::utils::find_bundled_executable(options_.sidecar_name);
}

std::optional<SpawnedProcess> SidecarManager::spawn() {
    std::string binary = resolve_binary();
    if (binary.empty()) {
        spdlog::error("[Sidecar] ********************************************************");
        spdlog::error("[Sidecar] Could not locate backend '{}'. Continuing WITHOUT a backend;",
                      options_.sidecar_name);
        spdlog::error("[Sidecar] billing features will be unavailable until restart.");
        spdlog::error("[Sidecar] ********************************************************");
        return std::nullopt;
    }

    spdlog::info("[Sidecar] Starting backend: {}", binary);

    try {
        SpawnedProcess spawned = host_->spawn(binary, options_.args, options_.working_dir);
        spdlog::info("[Sidecar] Backend started, PID: {}", spawned.handle.pid);
        {
            std::lock_guard<std::mutex> lock(exit_mutex_);
            process_exited_ = false;
        }
        return spawned;
    } catch (const std::exception& e) {
        spdlog::error("[Sidecar] ********************************************************");
        spdlog::error("[Sidecar] Failed to spawn backend: {}", e.what());
        spdlog::error("[Sidecar] Continuing WITHOUT a backend.");
        spdlog::error("[Sidecar] ********************************************************");
        return std::nullopt;
    }
}

bool SidecarManager::store(SidecarHandle handle) {
    return slot_->store(std::move(handle));
}

void SidecarManager::relay_output(std::shared_ptr<ProcessEventChannel> events) {
    if (relay_thread_.joinable()) {
        relay_thread_.join();
    }
    relay_events_ = events;
    relay_thread_ = std::thread(&SidecarManager::relay_loop, this, std::move(events));
}

void SidecarManager::relay_loop(std::shared_ptr<ProcessEventChannel> events) {
    while (auto event = events->receive()) {
        switch (event->kind) {
            case ProcessEventKind::STDOUT_LINE:
                spdlog::info("[Sidecar] {}", event->text);
                break;
            case ProcessEventKind::STDERR_LINE:
                spdlog::error("[Sidecar] {}", event->text);
                break;
            case ProcessEventKind::ERROR:
                spdlog::error("[Sidecar] Process error: {}", event->text);
                break;
            case ProcessEventKind::TERMINATED:
                if (event->exit_code) {
                    spdlog::warn("[Sidecar] Backend terminated with code {}", *event->exit_code);
                } else if (event->signal) {
                    spdlog::warn("[Sidecar] Backend terminated with code none (signal {})", *event->signal);
                } else {
                    spdlog::warn("[Sidecar] Backend terminated with code none");
                }
                {
                    std::lock_guard<std::mutex> lock(exit_mutex_);
                    process_exited_ = true;
                }
                exit_cv_.notify_all();
                break;
        }
    }

    if (stopping_) {
        return;
    }

    // Stream ended on its own: forget the handle unless a shutdown path already took it
    if (auto handle = slot_->take()) {
        spdlog::debug("[Sidecar] Output stream closed; cleared handle for PID {}", handle->process_id());
    }

    {
        std::lock_guard<std::mutex> lock(exit_mutex_);
        process_exited_ = true;
    }
    exit_cv_.notify_all();
}

void SidecarManager::graceful_shutdown() {
    auto pid = slot_->peek_id();
    if (pid) {
        spdlog::info("[Sidecar] Requesting graceful shutdown of PID {} via {}", *pid, requester_->describe());
        try {
            requester_->request_shutdown();
            spdlog::info("[Sidecar] Backend accepted the shutdown request");
        } catch (const std::exception& e) {
            spdlog::warn("[Sidecar] Shutdown request failed: {}", e.what());
        }
    } else {
        spdlog::debug("[Sidecar] No backend registered, skipping shutdown request");
    }

    wait_grace_period();

    terminate_if_present("window close");
    spdlog::info("[Sidecar] Graceful shutdown complete");
}

void SidecarManager::final_cleanup() {
    if (terminate_if_present("application exit")) {
        spdlog::info("[Sidecar] Final cleanup complete");
    }
}

void SidecarManager::wait_for_output_end() {
    if (relay_thread_.joinable()) {
        relay_thread_.join();
    }
}

void SidecarManager::skip_grace_period() {
    {
        std::lock_guard<std::mutex> lock(exit_mutex_);
        skip_grace_ = true;
    }
    exit_cv_.notify_all();
}

void SidecarManager::wait_grace_period() {
    spdlog::debug("[Sidecar] Waiting {}ms for the backend to exit", options_.grace_period.count());

    std::unique_lock<std::mutex> lock(exit_mutex_);
    bool ended_early = exit_cv_.wait_for(lock, options_.grace_period, [this]() {
        return skip_grace_ || (options_.end_grace_on_exit && process_exited_);
    });
    if (!ended_early) {
        return;
    }
    if (skip_grace_) {
        spdlog::info("[Sidecar] Grace period skipped");
    } else {
        spdlog::debug("[Sidecar] Backend exited before the grace period ended");
    }
}

bool SidecarManager::terminate_if_present(const char* reason) {
    auto handle = slot_->take();
    if (!handle) {
        spdlog::debug("[Sidecar] Nothing to terminate on {}", reason);
        return false;
    }

    int pid = handle->process_id();
    spdlog::info("[Sidecar] Force-terminating backend process tree (PID {}) on {}", pid, reason);
    try {
        terminator_->terminate_process_tree(pid);
    } catch (const std::exception& e) {
        spdlog::debug("[Sidecar] Termination of PID {} failed: {}", pid, e.what());
    }
    return true;
}

} // namespace siri_desktop

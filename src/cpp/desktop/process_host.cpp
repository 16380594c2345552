#include "siri_desktop/process_host.h"
#include <spdlog/spdlog.h>
#include <exception>

#ifndef _WIN32
#include <signal.h>
#include <cerrno>
#include <cstring>
#endif

namespace siri_desktop {

siri::utils::SpawnedProcess SystemProcessHost::spawn(
    const std::string& executable,
    const std::vector<std::string>& args,
    const std::string& working_dir)
{
    return siri::utils::ProcessManager::spawn_with_events(executable, args, working_dir);
}

#ifdef _WIN32

void SystemProcessTerminator::terminate_process_tree(int pid) {
    if (pid <= 0) {
        return;
    }

    try {
        int exit_code = siri::utils::ProcessManager::run_process_with_output(
            "taskkill",
            {"/PID", std::to_string(pid), "/T", "/F"},
            [](const std::string& line) {
                spdlog::debug("[Terminator] taskkill: {}", line);
                return true;
            },
            "",
            10);
        if (exit_code != 0) {
            spdlog::debug("[Terminator] taskkill exited with code {} for PID {}", exit_code, pid);
        }
    } catch (const std::exception& e) {
        spdlog::debug("[Terminator] taskkill failed for PID {}: {}", pid, e.what());
    }
}

#else  // Unix/Linux/macOS

void SystemProcessTerminator::terminate_process_tree(int pid) {
    if (pid <= 0) {
        return;
    }

    // The sidecar leads its own process group, so the negative pid reaches every descendant
    if (kill(-pid, SIGKILL) == 0) {
        return;
    }

    int group_errno = errno;
    // Group may not exist if setpgid lost a race with exec; fall back to the process itself
    if (kill(pid, SIGKILL) != 0) {
        spdlog::debug("[Terminator] kill failed for PID {}: group: {}, process: {}",
                      pid, strerror(group_errno), strerror(errno));
    }
}

#endif

} // namespace siri_desktop

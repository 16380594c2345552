#pragma once

#include <siri/utils/process_manager.h>
#include <string>
#include <vector>

namespace siri_desktop {

// Starts subprocesses and streams their output and lifecycle events
class ProcessHost {
public:
    virtual ~ProcessHost() = default;

    // Throws siri::ProcessException if the executable cannot be launched
    virtual siri::utils::SpawnedProcess spawn(
        const std::string& executable,
        const std::vector<std::string>& args,
        const std::string& working_dir) = 0;
};

class SystemProcessHost : public ProcessHost {
public:
    siri::utils::SpawnedProcess spawn(
        const std::string& executable,
        const std::vector<std::string>& args,
        const std::string& working_dir) override;
};

// Kills a process together with all of its descendants
class ProcessTerminator {
public:
    virtual ~ProcessTerminator() = default;

    // Best effort; failures are logged and otherwise ignored
    virtual void terminate_process_tree(int pid) = 0;
};

// Windows: taskkill /PID <pid> /T /F
// Elsewhere: SIGKILL to the process group led by <pid>
class SystemProcessTerminator : public ProcessTerminator {
public:
    void terminate_process_tree(int pid) override;
};

} // namespace siri_desktop

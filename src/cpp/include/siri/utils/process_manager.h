#pragma once

#include <string>
#include <vector>
#include <functional>
#include <memory>
#include <siri/utils/process_events.h>

namespace siri {
namespace utils {

// Platform-independent process handle
struct ProcessHandle {
    void* handle;
    int pid;
};

// A child started with piped output.
// The channel receives every stdout/stderr line followed by one TERMINATED
// event, then closes.
struct SpawnedProcess {
    ProcessHandle handle;
    std::shared_ptr<ProcessEventChannel> events;
};

// Callback for process output lines
// Returns: true to continue, false to kill the process
using OutputLineCallback = std::function<bool(const std::string& line)>;

class ProcessManager {
public:
    // Start a process in its own process group with stdout/stderr piped
    // into an event channel. Throws ProcessException if it cannot be started.
    static SpawnedProcess spawn_with_events(
        const std::string& executable,
        const std::vector<std::string>& args,
        const std::string& working_dir = "");

    // Run a process and capture its output line by line (stdout and stderr merged)
    // Blocks until process exits or callback returns false (which kills the process)
    // Returns: exit code, or -1 if killed by callback or timeout
    static int run_process_with_output(
        const std::string& executable,
        const std::vector<std::string>& args,
        OutputLineCallback on_line,
        const std::string& working_dir = "",
        int timeout_seconds = -1);

    // Release the OS resources held by a handle (Windows process handle).
    // Does not affect the running process.
    static void release_handle(ProcessHandle& handle);

    // Split a chunk of raw output into complete lines; the unterminated tail
    // stays in `pending`. Trailing '\r' is stripped from each line.
    static std::vector<std::string> split_lines(std::string& pending, const char* data, size_t length);
};

} // namespace utils
} // namespace siri

#include <siri/utils/process_manager.h>
#include <siri/error_types.h>
#include <spdlog/spdlog.h>
#include <thread>
#include <chrono>
#include <string>
#include <cstring>

#ifdef _WIN32
#include <windows.h>
// Undefine Windows macros that conflict with our enums
#ifdef ERROR
#undef ERROR
#endif
#else
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <signal.h>
#include <cerrno>
#endif

namespace siri {
namespace utils {

static ProcessEvent make_line_event(ProcessEventKind kind, const std::string& line) {
    return kind == ProcessEventKind::STDERR_LINE ? ProcessEvent::Stderr(line) : ProcessEvent::Stdout(line);
}

std::vector<std::string> ProcessManager::split_lines(std::string& pending, const char* data, size_t length) {
    std::vector<std::string> lines;
    pending.append(data, length);

    size_t start = 0;
    size_t pos;
    while ((pos = pending.find('\n', start)) != std::string::npos) {
        std::string line = pending.substr(start, pos - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        start = pos + 1;
    }
    pending.erase(0, start);

    return lines;
}

#ifdef _WIN32

// Quote one argument following the CommandLineToArgvW rules
static std::string quote_argument(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) {
        return arg;
    }

    std::string quoted = "\"";
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            backslashes++;
        } else if (c == '"') {
            quoted.append(backslashes * 2 + 1, '\\');
            quoted += '"';
            backslashes = 0;
        } else {
            quoted.append(backslashes, '\\');
            quoted += c;
            backslashes = 0;
        }
    }
    quoted.append(backslashes * 2, '\\');
    quoted += '"';
    return quoted;
}

static std::string build_command_line(const std::string& executable, const std::vector<std::string>& args) {
    std::string cmdline = "\"" + executable + "\"";
    for (const auto& arg : args) {
        cmdline += " " + quote_argument(arg);
    }
    return cmdline;
}

static std::string last_error_message() {
    DWORD error = GetLastError();
    char error_msg[256] = {};
    FormatMessageA(
        FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
        nullptr,
        error,
        0,
        error_msg,
        sizeof(error_msg),
        nullptr
    );
    std::string message = error_msg;
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }
    return message + " (Error code: " + std::to_string(error) + ")";
}

static void read_pipe_lines(HANDLE pipe, ProcessEventKind kind, std::shared_ptr<ProcessEventChannel> channel) {
    char buffer[4096];
    DWORD bytes_read;
    std::string pending;

    // Keep draining after the consumer goes away so the child never blocks on a full pipe
    while (ReadFile(pipe, buffer, sizeof(buffer), &bytes_read, nullptr) && bytes_read > 0) {
        for (const auto& line : ProcessManager::split_lines(pending, buffer, bytes_read)) {
            channel->send(make_line_event(kind, line));
        }
    }

    if (!pending.empty()) {
        if (pending.back() == '\r') {
            pending.pop_back();
        }
        channel->send(make_line_event(kind, pending));
    }

    CloseHandle(pipe);
}

SpawnedProcess ProcessManager::spawn_with_events(
    const std::string& executable,
    const std::vector<std::string>& args,
    const std::string& working_dir) {

    std::string cmdline = build_command_line(executable, args);

    SECURITY_ATTRIBUTES sa;
    sa.nLength = sizeof(SECURITY_ATTRIBUTES);
    sa.bInheritHandle = TRUE;
    sa.lpSecurityDescriptor = nullptr;

    HANDLE stdout_read = nullptr;
    HANDLE stdout_write = nullptr;
    HANDLE stderr_read = nullptr;
    HANDLE stderr_write = nullptr;

    if (!CreatePipe(&stdout_read, &stdout_write, &sa, 0)) {
        throw ProcessException(executable, "failed to create stdout pipe");
    }
    if (!CreatePipe(&stderr_read, &stderr_write, &sa, 0)) {
        CloseHandle(stdout_read);
        CloseHandle(stdout_write);
        throw ProcessException(executable, "failed to create stderr pipe");
    }

    // Make sure the read handles are not inherited
    SetHandleInformation(stdout_read, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(stderr_read, HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOA si;
    PROCESS_INFORMATION pi;
    ZeroMemory(&si, sizeof(si));
    si.cb = sizeof(si);
    ZeroMemory(&pi, sizeof(pi));
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
    si.hStdOutput = stdout_write;
    si.hStdError = stderr_write;

    spdlog::debug("[ProcessManager] Starting process: {}", cmdline);

    BOOL success = CreateProcessA(
        nullptr,
        const_cast<char*>(cmdline.c_str()),
        nullptr,
        nullptr,
        TRUE,  // Inherit handles
        CREATE_NO_WINDOW | CREATE_NEW_PROCESS_GROUP,
        nullptr,
        working_dir.empty() ? nullptr : working_dir.c_str(),
        &si,
        &pi
    );

    // Close write ends of pipes in parent process
    CloseHandle(stdout_write);
    CloseHandle(stderr_write);

    if (!success) {
        std::string error = last_error_message();
        CloseHandle(stdout_read);
        CloseHandle(stderr_read);
        throw ProcessException(executable, error);
    }

    CloseHandle(pi.hThread);

    // The supervisor waits on its own copy so the caller may release theirs at any time
    HANDLE wait_handle = nullptr;
    DuplicateHandle(GetCurrentProcess(), pi.hProcess, GetCurrentProcess(), &wait_handle,
                    0, FALSE, DUPLICATE_SAME_ACCESS);

    auto channel = std::make_shared<ProcessEventChannel>();

    std::thread([wait_handle, stdout_read, stderr_read, channel]() {
        std::thread out_reader(read_pipe_lines, stdout_read, ProcessEventKind::STDOUT_LINE, channel);
        std::thread err_reader(read_pipe_lines, stderr_read, ProcessEventKind::STDERR_LINE, channel);

        std::optional<int> exit_code;
        if (wait_handle) {
            WaitForSingleObject(wait_handle, INFINITE);
            DWORD code = 0;
            if (GetExitCodeProcess(wait_handle, &code)) {
                exit_code = static_cast<int>(code);
            }
            CloseHandle(wait_handle);
        }

        out_reader.join();
        err_reader.join();

        channel->send(ProcessEvent::Terminated(exit_code));
        channel->close();
    }).detach();

    spdlog::debug("[ProcessManager] Process started successfully, PID: {}", pi.dwProcessId);

    SpawnedProcess spawned;
    spawned.handle.handle = pi.hProcess;
    spawned.handle.pid = static_cast<int>(pi.dwProcessId);
    spawned.events = channel;
    return spawned;
}

int ProcessManager::run_process_with_output(
    const std::string& executable,
    const std::vector<std::string>& args,
    OutputLineCallback on_line,
    const std::string& working_dir,
    int timeout_seconds) {

    std::string cmdline = build_command_line(executable, args);

    SECURITY_ATTRIBUTES sa;
    sa.nLength = sizeof(SECURITY_ATTRIBUTES);
    sa.bInheritHandle = TRUE;
    sa.lpSecurityDescriptor = nullptr;

    HANDLE output_read = nullptr;
    HANDLE output_write = nullptr;
    if (!CreatePipe(&output_read, &output_write, &sa, 0)) {
        throw ProcessException(executable, "failed to create output pipe");
    }
    SetHandleInformation(output_read, HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOA si;
    PROCESS_INFORMATION pi;
    ZeroMemory(&si, sizeof(si));
    si.cb = sizeof(si);
    ZeroMemory(&pi, sizeof(pi));
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
    si.hStdOutput = output_write;
    si.hStdError = output_write;

    BOOL success = CreateProcessA(
        nullptr,
        const_cast<char*>(cmdline.c_str()),
        nullptr,
        nullptr,
        TRUE,
        CREATE_NO_WINDOW,
        nullptr,
        working_dir.empty() ? nullptr : working_dir.c_str(),
        &si,
        &pi
    );

    CloseHandle(output_write);

    if (!success) {
        std::string error = last_error_message();
        CloseHandle(output_read);
        throw ProcessException(executable, error);
    }
    CloseHandle(pi.hThread);

    auto start_time = std::chrono::steady_clock::now();
    char buffer[4096];
    std::string pending;
    bool killed = false;

    while (true) {
        DWORD available = 0;
        if (!PeekNamedPipe(output_read, nullptr, 0, nullptr, &available, nullptr)) {
            break;  // Pipe closed
        }

        if (available > 0) {
            DWORD bytes_read = 0;
            if (!ReadFile(output_read, buffer, sizeof(buffer), &bytes_read, nullptr) || bytes_read == 0) {
                break;
            }
            for (const auto& line : split_lines(pending, buffer, bytes_read)) {
                if (on_line && !on_line(line)) {
                    killed = true;
                    break;
                }
            }
            if (killed) {
                break;
            }
            continue;
        }

        if (timeout_seconds >= 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::steady_clock::now() - start_time);
            if (elapsed.count() >= timeout_seconds) {
                spdlog::warn("[ProcessManager] '{}' timed out after {}s", executable, timeout_seconds);
                killed = true;
                break;
            }
        }

        Sleep(50);
    }

    if (killed) {
        TerminateProcess(pi.hProcess, 1);
        WaitForSingleObject(pi.hProcess, 5000);
        CloseHandle(pi.hProcess);
        CloseHandle(output_read);
        return -1;
    }

    if (!pending.empty() && on_line) {
        if (pending.back() == '\r') {
            pending.pop_back();
        }
        on_line(pending);
    }

    WaitForSingleObject(pi.hProcess, INFINITE);
    DWORD exit_code = 0;
    GetExitCodeProcess(pi.hProcess, &exit_code);
    CloseHandle(pi.hProcess);
    CloseHandle(output_read);

    return static_cast<int>(exit_code);
}

void ProcessManager::release_handle(ProcessHandle& handle) {
    if (handle.handle) {
        CloseHandle(static_cast<HANDLE>(handle.handle));
        handle.handle = nullptr;
    }
}

#else  // Unix/Linux/macOS

static void make_pipe(int fds[2], const std::string& executable, const char* what) {
    if (pipe(fds) != 0) {
        throw ProcessException(executable, std::string("failed to create ") + what + " pipe: " + strerror(errno));
    }
    // Keep pipe ends out of unrelated children; dup2 clears the flag on the child's copies
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
}

// Fork and exec `executable`. The child gets its own process group when
// `new_group` is set. Exec failures are reported back through a CLOEXEC pipe
// and rethrown here as ProcessException.
static pid_t fork_exec(
    const std::string& executable,
    const std::vector<std::string>& args,
    const std::string& working_dir,
    int stdout_fd,
    int stderr_fd,
    const std::vector<int>& close_in_child,
    bool new_group) {

    int exec_pipe[2];
    make_pipe(exec_pipe, executable, "exec status");

    // Prepare argv before forking
    std::vector<char*> argv_ptrs;
    argv_ptrs.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args) {
        argv_ptrs.push_back(const_cast<char*>(arg.c_str()));
    }
    argv_ptrs.push_back(nullptr);

    pid_t pid = fork();

    if (pid < 0) {
        int err = errno;
        close(exec_pipe[0]);
        close(exec_pipe[1]);
        throw ProcessException(executable, std::string("fork failed: ") + strerror(err));
    }

    if (pid == 0) {
        // Child process
        if (new_group) {
            setpgid(0, 0);
        }

        dup2(stdout_fd, STDOUT_FILENO);
        dup2(stderr_fd, STDERR_FILENO);
        for (int fd : close_in_child) {
            close(fd);
        }
        close(exec_pipe[0]);

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            int err = errno;
            ssize_t written = write(exec_pipe[1], &err, sizeof(err));
            (void)written;
            _exit(127);
        }

        execvp(executable.c_str(), argv_ptrs.data());

        // If execvp returns, it failed
        int err = errno;
        ssize_t written = write(exec_pipe[1], &err, sizeof(err));
        (void)written;
        _exit(127);
    }

    // Parent process
    if (new_group) {
        // Also set from the parent so the group exists before we return
        setpgid(pid, pid);
    }
    close(exec_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (n > 0) {
        int status;
        waitpid(pid, &status, 0);
        throw ProcessException(executable, strerror(child_errno));
    }

    return pid;
}

static void read_pipe_lines(int fd, ProcessEventKind kind, std::shared_ptr<ProcessEventChannel> channel) {
    char buffer[4096];
    std::string pending;

    // Keep draining after the consumer goes away so the child never blocks on a full pipe
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (n == 0) {
            break;
        }
        for (const auto& line : ProcessManager::split_lines(pending, buffer, static_cast<size_t>(n))) {
            channel->send(make_line_event(kind, line));
        }
    }

    if (!pending.empty()) {
        if (pending.back() == '\r') {
            pending.pop_back();
        }
        channel->send(make_line_event(kind, pending));
    }

    close(fd);
}

SpawnedProcess ProcessManager::spawn_with_events(
    const std::string& executable,
    const std::vector<std::string>& args,
    const std::string& working_dir) {

    int out_pipe[2];
    int err_pipe[2];
    make_pipe(out_pipe, executable, "stdout");
    try {
        make_pipe(err_pipe, executable, "stderr");
    } catch (...) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        throw;
    }

    spdlog::debug("[ProcessManager] Starting process: {}", executable);

    pid_t pid;
    try {
        pid = fork_exec(executable, args, working_dir, out_pipe[1], err_pipe[1],
                        {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}, true);
    } catch (...) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        throw;
    }

    // Close write ends of pipes in parent process
    close(out_pipe[1]);
    close(err_pipe[1]);

    auto channel = std::make_shared<ProcessEventChannel>();
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];

    std::thread([pid, out_fd, err_fd, channel]() {
        std::thread out_reader(read_pipe_lines, out_fd, ProcessEventKind::STDOUT_LINE, channel);
        std::thread err_reader(read_pipe_lines, err_fd, ProcessEventKind::STDERR_LINE, channel);

        int status = 0;
        pid_t result;
        do {
            result = waitpid(pid, &status, 0);
        } while (result < 0 && errno == EINTR);

        out_reader.join();
        err_reader.join();

        if (result < 0) {
            channel->send(ProcessEvent::Error(std::string("waitpid failed: ") + strerror(errno)));
            channel->send(ProcessEvent::Terminated(std::nullopt));
        } else if (WIFEXITED(status)) {
            channel->send(ProcessEvent::Terminated(WEXITSTATUS(status)));
        } else if (WIFSIGNALED(status)) {
            channel->send(ProcessEvent::Terminated(std::nullopt, WTERMSIG(status)));
        } else {
            channel->send(ProcessEvent::Terminated(std::nullopt));
        }
        channel->close();
    }).detach();

    spdlog::debug("[ProcessManager] Process started successfully, PID: {}", pid);

    SpawnedProcess spawned;
    spawned.handle.handle = nullptr;
    spawned.handle.pid = pid;
    spawned.events = channel;
    return spawned;
}

int ProcessManager::run_process_with_output(
    const std::string& executable,
    const std::vector<std::string>& args,
    OutputLineCallback on_line,
    const std::string& working_dir,
    int timeout_seconds) {

    int output_pipe[2];
    make_pipe(output_pipe, executable, "output");

    pid_t pid;
    try {
        pid = fork_exec(executable, args, working_dir, output_pipe[1], output_pipe[1],
                        {output_pipe[0], output_pipe[1]}, false);
    } catch (...) {
        close(output_pipe[0]);
        close(output_pipe[1]);
        throw;
    }
    close(output_pipe[1]);

    auto start_time = std::chrono::steady_clock::now();
    char buffer[4096];
    std::string pending;
    bool killed = false;

    while (!killed) {
        int wait_ms = 100;
        if (timeout_seconds >= 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_time).count();
            if (elapsed >= timeout_seconds * 1000LL) {
                spdlog::warn("[ProcessManager] '{}' timed out after {}s", executable, timeout_seconds);
                killed = true;
                break;
            }
        }

        pollfd pfd;
        pfd.fd = output_pipe[0];
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ready = poll(&pfd, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = read(output_pipe[0], buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;  // EOF: child closed its output
        }

        for (const auto& line : split_lines(pending, buffer, static_cast<size_t>(n))) {
            if (on_line && !on_line(line)) {
                killed = true;
                break;
            }
        }
    }

    close(output_pipe[0]);

    int status = 0;
    if (killed) {
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        return -1;
    }

    if (!pending.empty() && on_line) {
        if (pending.back() == '\r') {
            pending.pop_back();
        }
        on_line(pending);
    }

    pid_t result;
    do {
        result = waitpid(pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result < 0) {
        return -1;
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

void ProcessManager::release_handle(ProcessHandle& handle) {
    // Nothing to release on Unix; the supervisor thread reaps the child
    handle.handle = nullptr;
}

#endif

} // namespace utils
} // namespace siri

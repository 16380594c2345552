#pragma once

#include <string>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <optional>

namespace siri {
namespace utils {

enum class ProcessEventKind {
    STDOUT_LINE,
    STDERR_LINE,
    ERROR,
    TERMINATED
};

// One event observed on a spawned child.
// For TERMINATED, exit_code is empty when the child was killed by a signal.
struct ProcessEvent {
    ProcessEventKind kind;
    std::string text;
    std::optional<int> exit_code;
    std::optional<int> signal;

    static ProcessEvent Stdout(const std::string& line) {
        return {ProcessEventKind::STDOUT_LINE, line, std::nullopt, std::nullopt};
    }

    static ProcessEvent Stderr(const std::string& line) {
        return {ProcessEventKind::STDERR_LINE, line, std::nullopt, std::nullopt};
    }

    static ProcessEvent Error(const std::string& message) {
        return {ProcessEventKind::ERROR, message, std::nullopt, std::nullopt};
    }

    static ProcessEvent Terminated(std::optional<int> code, std::optional<int> sig = std::nullopt) {
        return {ProcessEventKind::TERMINATED, "", code, sig};
    }
};

// Thread-safe queue carrying events from the reader threads to one consumer.
// receive() blocks until an event arrives; it returns nullopt once the
// channel is closed and drained.
class ProcessEventChannel {
public:
    ProcessEventChannel() = default;

    // Non-copyable
    ProcessEventChannel(const ProcessEventChannel&) = delete;
    ProcessEventChannel& operator=(const ProcessEventChannel&) = delete;

    // Returns false if the channel is already closed
    bool send(ProcessEvent event);

    std::optional<ProcessEvent> receive();

    void close();
    bool is_closed() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProcessEvent> queue_;
    bool closed_ = false;
};

} // namespace utils
} // namespace siri

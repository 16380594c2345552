#include <siri/utils/process_events.h>

namespace siri {
namespace utils {

bool ProcessEventChannel::send(ProcessEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
    return true;
}

std::optional<ProcessEvent> ProcessEventChannel::receive() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return !queue_.empty() || closed_; });

    if (queue_.empty()) {
        return std::nullopt;
    }

    ProcessEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

void ProcessEventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ProcessEventChannel::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace utils
} // namespace siri

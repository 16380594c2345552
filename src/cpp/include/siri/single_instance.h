#pragma once

#include <memory>
#include <string>

namespace siri {

// Per-user lock that keeps a second copy of the application from starting.
// The lock is held until the object is destroyed.
class SingleInstance {
public:
    // Empty when another process already holds the lock for app_name.
    // If the lock cannot be set up at all, a lock object is still returned
    // so the application is not blocked by a broken temp directory.
    static std::unique_ptr<SingleInstance> acquire(const std::string& app_name);

    ~SingleInstance();

    SingleInstance(const SingleInstance&) = delete;
    SingleInstance& operator=(const SingleInstance&) = delete;

    const std::string& name() const { return name_; }

private:
    explicit SingleInstance(std::string name) : name_(std::move(name)) {}

    std::string name_;
#ifdef _WIN32
    void* mutex_ = nullptr;   // HANDLE
#else
    int fd_ = -1;
#endif
};

} // namespace siri

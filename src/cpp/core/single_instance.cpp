#include <siri/single_instance.h>
#include <spdlog/spdlog.h>
#include <filesystem>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace siri {

#ifdef _WIN32

std::unique_ptr<SingleInstance> SingleInstance::acquire(const std::string& app_name) {
    // Session-local: one copy per logged-in user
    std::string mutex_name = "Local\\" + app_name + "-InstanceMutex";

    HANDLE mutex = CreateMutexA(nullptr, TRUE, mutex_name.c_str());
    if (GetLastError() == ERROR_ALREADY_EXISTS) {
        if (mutex) {
            CloseHandle(mutex);
        }
        return nullptr;
    }
    if (!mutex) {
        spdlog::warn("[SingleInstance] CreateMutex failed ({}); not enforcing a single instance",
                     GetLastError());
    }
    std::unique_ptr<SingleInstance> lock(new SingleInstance(mutex_name));
    lock->mutex_ = mutex;
    return lock;
}

SingleInstance::~SingleInstance() {
    if (mutex_) {
        ReleaseMutex(static_cast<HANDLE>(mutex_));
        CloseHandle(static_cast<HANDLE>(mutex_));
    }
}

#else

std::unique_ptr<SingleInstance> SingleInstance::acquire(const std::string& app_name) {
    std::error_code ec;
    std::filesystem::path lock_dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        lock_dir = "/tmp";
    }
    std::string lock_file = (lock_dir / (app_name + ".lock")).string();

    int fd = open(lock_file.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0666);
    if (fd == -1) {
        spdlog::warn("[SingleInstance] Cannot open {}: {}; not enforcing a single instance",
                     lock_file, strerror(errno));
        return std::unique_ptr<SingleInstance>(new SingleInstance(lock_file));
    }

    if (flock(fd, LOCK_EX | LOCK_NB) == -1) {
        int err = errno;
        close(fd);
        if (err == EWOULDBLOCK) {
            return nullptr;
        }
        spdlog::warn("[SingleInstance] Cannot lock {}: {}; not enforcing a single instance",
                     lock_file, strerror(err));
        return std::unique_ptr<SingleInstance>(new SingleInstance(lock_file));
    }

    std::unique_ptr<SingleInstance> lock(new SingleInstance(lock_file));
    lock->fd_ = fd;
    return lock;
}

SingleInstance::~SingleInstance() {
    if (fd_ != -1) {
        flock(fd_, LOCK_UN);
        close(fd_);
    }
}

#endif

} // namespace siri

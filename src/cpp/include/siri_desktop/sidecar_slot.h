#pragma once

#include <siri/utils/process_manager.h>
#include <mutex>
#include <optional>

namespace siri_desktop {

// Ownership capsule over the running backend process.
// Move-only; releases the OS handle (not the process) on destruction.
class SidecarHandle {
public:
    explicit SidecarHandle(siri::utils::ProcessHandle process);
    ~SidecarHandle();

    SidecarHandle(SidecarHandle&& other) noexcept;
    SidecarHandle& operator=(SidecarHandle&& other) noexcept;

    SidecarHandle(const SidecarHandle&) = delete;
    SidecarHandle& operator=(const SidecarHandle&) = delete;

    int process_id() const { return process_.pid; }

private:
    siri::utils::ProcessHandle process_;
};

// Shared cell holding at most one SidecarHandle.
// Every operation holds the lock only for the duration of the call; whoever
// take()s the handle first is the only party allowed to act on it.
class SidecarSlot {
public:
    SidecarSlot() = default;

    SidecarSlot(const SidecarSlot&) = delete;
    SidecarSlot& operator=(const SidecarSlot&) = delete;

    // Returns false and leaves the slot untouched if a handle is already stored
    bool store(SidecarHandle handle);

    // Remove and return the handle; empty if it was already taken
    std::optional<SidecarHandle> take();

    std::optional<int> peek_id() const;

    bool is_present() const;

private:
    mutable std::mutex mutex_;
    std::optional<SidecarHandle> handle_;
};

} // namespace siri_desktop

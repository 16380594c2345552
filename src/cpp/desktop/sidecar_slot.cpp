#include "siri_desktop/sidecar_slot.h"

namespace siri_desktop {

SidecarHandle::SidecarHandle(siri::utils::ProcessHandle process)
    : process_(process)
{
}

SidecarHandle::~SidecarHandle() {
    siri::utils::ProcessManager::release_handle(process_);
}

SidecarHandle::SidecarHandle(SidecarHandle&& other) noexcept
    : process_(other.process_)
{
    other.process_.handle = nullptr;
    other.process_.pid = 0;
}

SidecarHandle& SidecarHandle::operator=(SidecarHandle&& other) noexcept {
    if (this != &other) {
        siri::utils::ProcessManager::release_handle(process_);
        process_ = other.process_;
        other.process_.handle = nullptr;
        other.process_.pid = 0;
    }
    return *this;
}

bool SidecarSlot::store(SidecarHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_) {
        return false;
    }
    handle_.emplace(std::move(handle));
    return true;
}

std::optional<SidecarHandle> SidecarSlot::take() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<SidecarHandle> taken = std::move(handle_);
    handle_.reset();
    return taken;
}

std::optional<int> SidecarSlot::peek_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handle_) {
        return std::nullopt;
    }
    return handle_->process_id();
}

bool SidecarSlot::is_present() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_.has_value();
}

} // namespace siri_desktop

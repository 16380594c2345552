#include "siri_desktop/platform/window_interface.h"
#include "siri_desktop/platform/headless_window.h"

namespace siri_desktop {

std::unique_ptr<WindowInterface> create_window(bool launch_browser) {
    return std::make_unique<HeadlessWindow>(launch_browser);
}

} // namespace siri_desktop

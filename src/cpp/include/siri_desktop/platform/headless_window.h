#pragma once

#include "siri_desktop/platform/window_interface.h"
#include <condition_variable>
#include <deque>
#include <mutex>

namespace siri_desktop {

// Shows the user interface in the system browser and keeps an event loop
// alive until it is asked to close
class HeadlessWindow : public WindowInterface {
public:
    explicit HeadlessWindow(bool launch_browser = true);
    ~HeadlessWindow() override;

    bool initialize(const std::string& title, const std::string& url) override;
    void run() override;
    void request_close() override;
    void stop() override;
    void set_event_callback(WindowEventCallback callback) override;

    // Report a focus change; delivered on the event loop
    void notify_focus(bool focused);

    static bool open_url(const std::string& url);

private:
    enum class Command { CLOSE, STOP, FOCUS_GAINED, FOCUS_LOST };

    void post(Command command);
    void emit(const WindowEvent& event);

    bool launch_browser_;
    std::string title_;
    std::string url_;
    WindowEventCallback callback_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Command> commands_;
    bool initialized_ = false;
};

} // namespace siri_desktop

#pragma once

#include <functional>
#include <memory>
#include <string>

namespace siri_desktop {

enum class WindowEventKind {
    CLOSE_REQUESTED,   // user asked to close the main window
    FOCUSED,           // focus gained or lost, see WindowEvent::focused
    EXIT_REQUESTED,    // the event loop is about to end
    EXIT               // the event loop has ended
};

struct WindowEvent {
    WindowEventKind kind;
    bool focused = false;

    static WindowEvent CloseRequested() { return {WindowEventKind::CLOSE_REQUESTED, false}; }
    static WindowEvent Focused(bool focused) { return {WindowEventKind::FOCUSED, focused}; }
    static WindowEvent ExitRequested() { return {WindowEventKind::EXIT_REQUESTED, false}; }
    static WindowEvent Exit() { return {WindowEventKind::EXIT, false}; }
};

// Handlers run on the thread executing run()
using WindowEventCallback = std::function<void(const WindowEvent&)>;

// Abstract main window host
class WindowInterface {
public:
    virtual ~WindowInterface() = default;

    // Lifecycle
    virtual bool initialize(const std::string& title, const std::string& url) = 0;
    virtual void run() = 0;

    // Behave as if the user closed the window: CLOSE_REQUESTED, then exit
    virtual void request_close() = 0;

    // End the event loop without a close request
    virtual void stop() = 0;

    virtual void set_event_callback(WindowEventCallback callback) = 0;
};

// Factory function to create the platform window host
std::unique_ptr<WindowInterface> create_window(bool launch_browser = true);

} // namespace siri_desktop

#include "siri_desktop/platform/headless_window.h"
#include <spdlog/spdlog.h>
#include <cstdlib>

#ifdef _WIN32
#include <windows.h>
#include <shellapi.h>
#endif

namespace siri_desktop {

HeadlessWindow::HeadlessWindow(bool launch_browser)
    : launch_browser_(launch_browser)
{
}

HeadlessWindow::~HeadlessWindow() = default;

bool HeadlessWindow::initialize(const std::string& title, const std::string& url) {
    if (url.empty()) {
        spdlog::error("[Window] No user interface URL configured");
        return false;
    }

    title_ = title;
    url_ = url;

    if (launch_browser_) {
        spdlog::info("[Window] Opening {} at {}", title_, url_);
        if (!open_url(url_)) {
            spdlog::warn("[Window] Could not open a browser; visit {} manually", url_);
        }
    } else {
        spdlog::info("[Window] Running headless; user interface available at {}", url_);
    }

    initialized_ = true;
    return true;
}

void HeadlessWindow::run() {
    if (!initialized_) {
        spdlog::error("[Window] run() called before initialize()");
        return;
    }

    spdlog::debug("[Window] Entering event loop");
    bool running = true;
    while (running) {
        Command command;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return !commands_.empty(); });
            command = commands_.front();
            commands_.pop_front();
        }

        switch (command) {
            case Command::CLOSE:
                emit(WindowEvent::CloseRequested());
                running = false;
                break;
            case Command::STOP:
                running = false;
                break;
            case Command::FOCUS_GAINED:
                emit(WindowEvent::Focused(true));
                break;
            case Command::FOCUS_LOST:
                emit(WindowEvent::Focused(false));
                break;
        }
    }

    emit(WindowEvent::ExitRequested());
    emit(WindowEvent::Exit());
    spdlog::debug("[Window] Event loop exited");
}

void HeadlessWindow::request_close() {
    post(Command::CLOSE);
}

void HeadlessWindow::stop() {
    post(Command::STOP);
}

void HeadlessWindow::notify_focus(bool focused) {
    post(focused ? Command::FOCUS_GAINED : Command::FOCUS_LOST);
}

void HeadlessWindow::set_event_callback(WindowEventCallback callback) {
    callback_ = std::move(callback);
}

void HeadlessWindow::post(Command command) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        commands_.push_back(command);
    }
    cv_.notify_one();
}

void HeadlessWindow::emit(const WindowEvent& event) {
    if (callback_) {
        callback_(event);
    }
}

bool HeadlessWindow::open_url(const std::string& url) {
#ifdef _WIN32
    auto result = reinterpret_cast<INT_PTR>(
        ShellExecuteA(nullptr, "open", url.c_str(), nullptr, nullptr, SW_SHOWNORMAL));
    return result > 32;
#elif defined(__APPLE__)
    int result = system(("open \"" + url + "\"").c_str());
    return result == 0;
#else
    int result = system(("xdg-open \"" + url + "\" >/dev/null 2>&1 &").c_str());
    return result == 0;
#endif
}

} // namespace siri_desktop

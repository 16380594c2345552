#include <gtest/gtest.h>
#include <siri_desktop/platform/headless_window.h>
#include <thread>
#include <vector>

using siri_desktop::HeadlessWindow;
using siri_desktop::WindowEvent;
using siri_desktop::WindowEventKind;

namespace {

std::vector<WindowEventKind> kinds_of(const std::vector<WindowEvent>& events) {
    std::vector<WindowEventKind> kinds;
    for (const auto& event : events) {
        kinds.push_back(event.kind);
    }
    return kinds;
}

} // namespace

TEST(HeadlessWindowTest, RejectsEmptyUrl) {
    HeadlessWindow window(false);
    EXPECT_FALSE(window.initialize("Siri Billing", ""));
}

TEST(HeadlessWindowTest, CloseRequestUnwindsInOrder) {
    HeadlessWindow window(false);
    std::vector<WindowEvent> events;
    window.set_event_callback([&events](const WindowEvent& e) { events.push_back(e); });
    ASSERT_TRUE(window.initialize("Siri Billing", "http://localhost:1420"));

    window.notify_focus(true);
    window.request_close();
    window.run();

    ASSERT_EQ(kinds_of(events), (std::vector<WindowEventKind>{
        WindowEventKind::FOCUSED,
        WindowEventKind::CLOSE_REQUESTED,
        WindowEventKind::EXIT_REQUESTED,
        WindowEventKind::EXIT}));
    EXPECT_TRUE(events[0].focused);
}

TEST(HeadlessWindowTest, StopSkipsCloseRequest) {
    HeadlessWindow window(false);
    std::vector<WindowEvent> events;
    window.set_event_callback([&events](const WindowEvent& e) { events.push_back(e); });
    ASSERT_TRUE(window.initialize("Siri Billing", "http://localhost:1420"));

    std::thread stopper([&window]() { window.stop(); });
    window.run();
    stopper.join();

    EXPECT_EQ(kinds_of(events), (std::vector<WindowEventKind>{
        WindowEventKind::EXIT_REQUESTED,
        WindowEventKind::EXIT}));
}

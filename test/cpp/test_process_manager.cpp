#ifndef _WIN32

#include <gtest/gtest.h>
#include <siri/error_types.h>
#include <siri/utils/process_manager.h>
#include <siri_desktop/process_host.h>
#include <chrono>
#include <csignal>
#include <string>
#include <vector>

using siri::utils::ProcessEvent;
using siri::utils::ProcessEventKind;
using siri::utils::ProcessManager;

namespace {

std::vector<ProcessEvent> drain(const std::shared_ptr<siri::utils::ProcessEventChannel>& channel) {
    std::vector<ProcessEvent> events;
    while (auto event = channel->receive()) {
        events.push_back(*event);
    }
    return events;
}

std::vector<std::string> texts_of(const std::vector<ProcessEvent>& events, ProcessEventKind kind) {
    std::vector<std::string> texts;
    for (const auto& e : events) {
        if (e.kind == kind) {
            texts.push_back(e.text);
        }
    }
    return texts;
}

} // namespace

TEST(ProcessManagerTest, StreamsOutputThenTermination) {
    auto spawned = ProcessManager::spawn_with_events(
        "/bin/sh", {"-c", "echo hi; echo err 1>&2; exit 3"});
    EXPECT_GT(spawned.handle.pid, 0);

    auto events = drain(spawned.events);
    ASSERT_FALSE(events.empty());

    EXPECT_EQ(texts_of(events, ProcessEventKind::STDOUT_LINE), std::vector<std::string>{"hi"});
    EXPECT_EQ(texts_of(events, ProcessEventKind::STDERR_LINE), std::vector<std::string>{"err"});

    const auto& last = events.back();
    EXPECT_EQ(last.kind, ProcessEventKind::TERMINATED);
    ASSERT_TRUE(last.exit_code.has_value());
    EXPECT_EQ(*last.exit_code, 3);
    EXPECT_TRUE(spawned.events->is_closed());

    ProcessManager::release_handle(spawned.handle);
}

TEST(ProcessManagerTest, UsesWorkingDirectory) {
    auto spawned = ProcessManager::spawn_with_events("/bin/sh", {"-c", "pwd"}, "/");
    auto events = drain(spawned.events);
    EXPECT_EQ(texts_of(events, ProcessEventKind::STDOUT_LINE), std::vector<std::string>{"/"});
    ProcessManager::release_handle(spawned.handle);
}

TEST(ProcessManagerTest, MissingExecutableThrows) {
    EXPECT_THROW(
        ProcessManager::spawn_with_events("/nonexistent/siri-billing-backend", {}),
        siri::ProcessException);
}

TEST(ProcessManagerTest, TerminatorKillsWholeProcessGroup) {
    // The shell forks a child sleep; both must die
    auto spawned = ProcessManager::spawn_with_events(
        "/bin/sh", {"-c", "sleep 30 & sleep 30; wait"});

    siri_desktop::SystemProcessTerminator terminator;
    terminator.terminate_process_tree(spawned.handle.pid);

    auto start = std::chrono::steady_clock::now();
    auto events = drain(spawned.events);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::seconds(10));
    ASSERT_FALSE(events.empty());
    const auto& last = events.back();
    EXPECT_EQ(last.kind, ProcessEventKind::TERMINATED);
    EXPECT_FALSE(last.exit_code.has_value());
    ASSERT_TRUE(last.signal.has_value());
    EXPECT_EQ(*last.signal, SIGKILL);

    ProcessManager::release_handle(spawned.handle);
}

TEST(ProcessManagerTest, TerminatingAnExitedProcessIsHarmless) {
    auto spawned = ProcessManager::spawn_with_events("/bin/sh", {"-c", "exit 0"});
    drain(spawned.events);

    siri_desktop::SystemProcessTerminator terminator;
    EXPECT_NO_THROW(terminator.terminate_process_tree(spawned.handle.pid));
    ProcessManager::release_handle(spawned.handle);
}

TEST(ProcessManagerTest, RunProcessCollectsMergedOutput) {
    std::vector<std::string> lines;
    int code = ProcessManager::run_process_with_output(
        "/bin/sh", {"-c", "echo first; echo second 1>&2"},
        [&lines](const std::string& line) {
            lines.push_back(line);
            return true;
        });

    EXPECT_EQ(code, 0);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "first");
    EXPECT_EQ(lines[1], "second");
}

TEST(ProcessManagerTest, RunProcessReportsExitCode) {
    int code = ProcessManager::run_process_with_output(
        "/bin/sh", {"-c", "exit 7"},
        [](const std::string&) { return true; });
    EXPECT_EQ(code, 7);
}

TEST(ProcessManagerTest, RunProcessTimesOut) {
    auto start = std::chrono::steady_clock::now();
    int code = ProcessManager::run_process_with_output(
        "/bin/sh", {"-c", "sleep 30"},
        [](const std::string&) { return true; },
        "", 1);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(code, -1);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST(ProcessManagerTest, RunProcessStopsWhenCallbackDeclines) {
    int code = ProcessManager::run_process_with_output(
        "/bin/sh", {"-c", "echo stop-here; sleep 30"},
        [](const std::string&) { return false; });
    EXPECT_EQ(code, -1);
}

#endif  // _WIN32

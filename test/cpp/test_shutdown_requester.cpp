#include <gtest/gtest.h>
#include <siri/error_types.h>
#include <siri_desktop/shutdown_requester.h>
#include <httplib.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

using siri_desktop::HttpShutdownRequester;
using siri_desktop::ShutdownEndpoint;

namespace {

class FakeBackend {
public:
    // stall: hold every request until the backend is destroyed
    explicit FakeBackend(int status, bool stall = false) {
        server_.Post("/api/shutdown", [this, status, stall](const httplib::Request&, httplib::Response& res) {
            hits++;
            if (stall) {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait_for(lock, std::chrono::seconds(10), [this]() { return released_; });
            }
            res.status = status;
            res.set_content(R"({"status":"shutting down"})", "application/json");
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        while (port_ > 0 && !server_.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    ~FakeBackend() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    int port() const { return port_; }

    std::atomic<int> hits{0};

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool released_ = false;
    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
};

ShutdownEndpoint endpoint_for(int port) {
    ShutdownEndpoint endpoint;
    endpoint.host = "127.0.0.1";
    endpoint.port = port;
    endpoint.timeout_seconds = 2;
    return endpoint;
}

} // namespace

TEST(HttpShutdownRequesterTest, DescribesEndpoint) {
    ShutdownEndpoint endpoint;
    HttpShutdownRequester requester(endpoint);
    EXPECT_EQ(requester.describe(), "http://localhost:8080/api/shutdown");
}

TEST(HttpShutdownRequesterTest, PostsToShutdownPath) {
    FakeBackend backend(200);
    ASSERT_GT(backend.port(), 0);

    HttpShutdownRequester requester(endpoint_for(backend.port()));
    EXPECT_NO_THROW(requester.request_shutdown());
    EXPECT_EQ(backend.hits.load(), 1);
}

TEST(HttpShutdownRequesterTest, ErrorStatusThrows) {
    FakeBackend backend(500);
    ASSERT_GT(backend.port(), 0);

    HttpShutdownRequester requester(endpoint_for(backend.port()));
    try {
        requester.request_shutdown();
        FAIL() << "expected NetworkException";
    } catch (const siri::NetworkException& e) {
        EXPECT_EQ(e.status_code(), 500);
    }
}

TEST(HttpShutdownRequesterTest, RefusedConnectionThrows) {
    int port = 0;
    {
        // Grab a free port, then release it so nothing is listening there
        FakeBackend closed(200);
        port = closed.port();
    }
    ASSERT_GT(port, 0);

    HttpShutdownRequester requester(endpoint_for(port));
    EXPECT_THROW(requester.request_shutdown(), siri::NetworkException);
}

TEST(HttpShutdownRequesterTest, StalledBackendIsAbandonedAtTheTimeout) {
    FakeBackend backend(200, true);
    ASSERT_GT(backend.port(), 0);

    ShutdownEndpoint endpoint = endpoint_for(backend.port());
    endpoint.timeout_seconds = 1;
    HttpShutdownRequester requester(endpoint);

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(requester.request_shutdown(), siri::NetworkException);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, std::chrono::milliseconds(900));
    EXPECT_LT(elapsed, std::chrono::milliseconds(2500));
    EXPECT_EQ(backend.hits.load(), 1);
}

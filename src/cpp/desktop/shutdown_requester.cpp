#include "siri_desktop/shutdown_requester.h"
#include <siri/error_types.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>
#include <future>
#include <thread>

// Plain HTTP only: the backend is always on the loopback interface
#include <httplib.h>

namespace siri_desktop {

HttpShutdownRequester::HttpShutdownRequester(ShutdownEndpoint endpoint)
    : endpoint_(std::move(endpoint))
{
}

void HttpShutdownRequester::request_shutdown() {
    httplib::Client cli(endpoint_.host, endpoint_.port);
    cli.set_connection_timeout(endpoint_.timeout_seconds, 0);
    cli.set_read_timeout(endpoint_.timeout_seconds, 0);
    cli.set_write_timeout(endpoint_.timeout_seconds, 0);

    // The per-phase timeouts add up; the deadline bounds the whole exchange
    std::promise<httplib::Result> done;
    auto pending = done.get_future();
    std::thread worker([this, &cli, &done]() {
        try {
            done.set_value(cli.Post(endpoint_.path, std::string(), "application/json"));
        } catch (const std::exception&) {
            done.set_exception(std::current_exception());
        }
    });

    if (pending.wait_for(std::chrono::seconds(endpoint_.timeout_seconds)) == std::future_status::timeout) {
        spdlog::debug("[Sidecar] Shutdown request exceeded {}s, aborting", endpoint_.timeout_seconds);
        cli.stop();
        worker.join();
        throw siri::NetworkException("POST " + endpoint_.url() + " timed out after " +
                                     std::to_string(endpoint_.timeout_seconds) + "s");
    }
    worker.join();

    auto res = pending.get();

    if (!res) {
        throw siri::NetworkException("POST " + endpoint_.url() + " failed: " +
                                     httplib::to_string(res.error()));
    }

    if (res->status < 200 || res->status >= 300) {
        throw siri::NetworkException("POST " + endpoint_.url() + " returned status " +
                                     std::to_string(res->status), res->status);
    }
}

} // namespace siri_desktop

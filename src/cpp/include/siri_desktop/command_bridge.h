#pragma once

#ifndef CPPHTTPLIB_THREAD_POOL_COUNT
#define CPPHTTPLIB_THREAD_POOL_COUNT 4
#endif

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <siri/error_types.h>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <atomic>
#include <vector>

namespace siri_desktop {

using json = nlohmann::json;

using CommandHandler = std::function<json(const json& args)>;

// Named native commands callable from the user interface
class CommandRegistry {
public:
    // Replaces an existing handler with the same name
    void add(const std::string& name, CommandHandler handler);

    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;

    // Throws UnknownCommandException for unregistered names.
    // Handler exceptions propagate unchanged.
    json invoke(const std::string& name, const json& args) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, CommandHandler> handlers_;
};

// HTTP status used when a command fails with the given exception
int status_for_error(const siri::ShellException& e);

// "scheme://host[:port]" of a URL, lower-cased, without path or query.
// Empty when the URL has no scheme.
std::string origin_of(const std::string& url);

// Loopback HTTP bridge: POST /invoke/<command> with a JSON object body.
// Success: 200 {"result": ...}. Failure: {"error": {"message", "type"}}.
// Browser requests are only served for allowed_origin; any other Origin
// gets 403. Requests without an Origin header are not from a web page.
class CommandBridge {
public:
    CommandBridge(std::shared_ptr<CommandRegistry> registry,
                  const std::string& host = "127.0.0.1",
                  int port = 1421,
                  const std::string& allowed_origin = "");
    ~CommandBridge();

    // Bind and serve on a background thread. port 0 picks a free port.
    // Returns false if the port could not be bound.
    bool start();
    void stop();

    bool is_running() const { return running_; }
    int port() const { return port_; }
    const std::string& allowed_origin() const { return allowed_origin_; }

private:
    void setup_routes();
    void setup_cors();
    void handle_invoke(const httplib::Request& req, httplib::Response& res);
    bool origin_allowed(const httplib::Request& req) const;

    std::shared_ptr<CommandRegistry> registry_;
    std::string host_;
    int port_;
    std::string allowed_origin_;
    std::unique_ptr<httplib::Server> http_server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};
};

} // namespace siri_desktop

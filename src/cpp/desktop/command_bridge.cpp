#include "siri_desktop/command_bridge.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <chrono>

namespace siri_desktop {

void CommandRegistry::add(const std::string& name, CommandHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[name] = std::move(handler);
}

bool CommandRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.count(name) > 0;
}

std::vector<std::string> CommandRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& entry : handlers_) {
        result.push_back(entry.first);
    }
    return result;
}

json CommandRegistry::invoke(const std::string& name, const json& args) const {
    CommandHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(name);
        if (it == handlers_.end()) {
            throw siri::UnknownCommandException(name);
        }
        handler = it->second;
    }
    // Run outside the lock: handlers may block (downloads, printing)
    return handler(args);
}

int status_for_error(const siri::ShellException& e) {
    const std::string& type = e.type();
    if (type == siri::ErrorType::INVALID_REQUEST) return 400;
    if (type == siri::ErrorType::UNKNOWN_COMMAND) return 404;
    if (type == siri::ErrorType::UNSUPPORTED_OPERATION) return 501;
    if (type == siri::ErrorType::NETWORK_ERROR) return 502;
    return 500;
}

std::string origin_of(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return "";
    }
    auto authority_end = url.find_first_of("/?#", scheme_end + 3);
    std::string origin = url.substr(0, authority_end);
    if (origin.size() == scheme_end + 3) {
        return "";
    }
    std::transform(origin.begin(), origin.end(), origin.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return origin;
}

CommandBridge::CommandBridge(std::shared_ptr<CommandRegistry> registry,
                             const std::string& host,
                             int port,
                             const std::string& allowed_origin)
    : registry_(std::move(registry))
    , host_(host)
    , port_(port)
    , allowed_origin_(origin_of(allowed_origin))
    , http_server_(std::make_unique<httplib::Server>())
{
    setup_routes();
    setup_cors();
}

CommandBridge::~CommandBridge() {
    stop();
}

void CommandBridge::setup_routes() {
    http_server_->Post(R"(/invoke/([A-Za-z0-9_\-]+))",
                       [this](const httplib::Request& req, httplib::Response& res) {
        handle_invoke(req, res);
    });

    http_server_->Get("/commands", [this](const httplib::Request&, httplib::Response& res) {
        json body = {{"commands", registry_->names()}};
        res.set_content(body.dump(), "application/json");
    });
}

bool CommandBridge::origin_allowed(const httplib::Request& req) const {
    if (!req.has_header("Origin")) {
        return true;
    }
    std::string origin = origin_of(req.get_header_value("Origin"));
    return !origin.empty() && origin == allowed_origin_;
}

void CommandBridge::setup_cors() {
    httplib::Headers headers = {
        {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type"},
        {"Vary", "Origin"}
    };
    if (!allowed_origin_.empty()) {
        headers.emplace("Access-Control-Allow-Origin", allowed_origin_);
    }
    http_server_->set_default_headers(headers);

    // Web pages other than the user interface must not print, install or read logs
    http_server_->set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (origin_allowed(req)) {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        spdlog::warn("[Bridge] Rejected {} {} from origin {}",
                     req.method, req.path, req.get_header_value("Origin"));
        res.status = 403;
        res.set_content(siri::ErrorResponse::create("Origin is not allowed to use native commands",
                                                    siri::ErrorType::FORBIDDEN).dump(),
                        "application/json");
        return httplib::Server::HandlerResponse::Handled;
    });

    http_server_->Options(".*", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    http_server_->set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        spdlog::warn("[Bridge] Error {}: {} {}", res.status, req.method, req.path);
        if (res.status == 404 && res.body.empty()) {
            json error = {
                {"error", {
                    {"message", "The requested endpoint does not exist"},
                    {"type", "not_found"},
                    {"path", req.path}
                }}
            };
            res.set_content(error.dump(), "application/json");
        }
    });
}

void CommandBridge::handle_invoke(const httplib::Request& req, httplib::Response& res) {
    std::string command = req.matches[1];

    try {
        json args = json::object();
        if (!req.body.empty()) {
            try {
                args = json::parse(req.body);
            } catch (const json::parse_error& e) {
                throw siri::InvalidRequestException(std::string("body is not valid JSON: ") + e.what());
            }
            if (args.is_null()) {
                args = json::object();
            } else if (!args.is_object()) {
                throw siri::InvalidRequestException("arguments must be a JSON object");
            }
        }

        spdlog::debug("[Bridge] Invoking '{}'", command);
        json result = registry_->invoke(command, args);
        res.status = 200;
        res.set_content(json{{"result", result}}.dump(), "application/json");
    } catch (const siri::ShellException& e) {
        spdlog::error("[Bridge] Command '{}' failed: {}", command, e.what());
        res.status = status_for_error(e);
        res.set_content(siri::ErrorResponse::from_exception(e).dump(), "application/json");
    } catch (const json::exception& e) {
        // Handler read an argument of the wrong type
        spdlog::error("[Bridge] Command '{}' received bad arguments: {}", command, e.what());
        res.status = 400;
        res.set_content(siri::ErrorResponse::create(e.what(), siri::ErrorType::INVALID_REQUEST).dump(),
                        "application/json");
    } catch (const std::exception& e) {
        spdlog::error("[Bridge] Command '{}' failed: {}", command, e.what());
        res.status = 500;
        res.set_content(siri::ErrorResponse::from_std_exception(e).dump(), "application/json");
    }
}

bool CommandBridge::start() {
    if (running_) {
        return true;
    }

    if (port_ == 0) {
        int bound = http_server_->bind_to_any_port(host_);
        if (bound <= 0) {
            spdlog::error("[Bridge] Failed to bind to any port on {}", host_);
            return false;
        }
        port_ = bound;
    } else if (!http_server_->bind_to_port(host_, port_)) {
        spdlog::error("[Bridge] Failed to bind to {}:{}", host_, port_);
        return false;
    }

    running_ = true;
    server_thread_ = std::thread([this]() {
        spdlog::info("[Bridge] Listening on {}:{}", host_, port_);
        if (!http_server_->listen_after_bind()) {
            spdlog::warn("[Bridge] Listener stopped unexpectedly");
        }
        running_ = false;
    });

    // stop() is only effective once the listener is up
    for (int i = 0; i < 200 && !http_server_->is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

void CommandBridge::stop() {
    if (http_server_) {
        http_server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
        spdlog::debug("[Bridge] Stopped");
    }
    running_ = false;
}

} // namespace siri_desktop

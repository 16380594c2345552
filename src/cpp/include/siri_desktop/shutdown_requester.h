#pragma once

#include <string>

namespace siri_desktop {

// Where the backend listens for its self-termination request
struct ShutdownEndpoint {
    std::string host = "localhost";
    int port = 8080;
    std::string path = "/api/shutdown";
    int timeout_seconds = 5;          // bounds the whole request, connect to response

    std::string url() const {
        return "http://" + host + ":" + std::to_string(port) + path;
    }
};

// Asks the backend to exit on its own
class ShutdownRequester {
public:
    virtual ~ShutdownRequester() = default;

    // Throws siri::NetworkException on transport failure or a non-2xx answer
    virtual void request_shutdown() = 0;

    virtual std::string describe() const = 0;
};

class HttpShutdownRequester : public ShutdownRequester {
public:
    explicit HttpShutdownRequester(ShutdownEndpoint endpoint);

    void request_shutdown() override;
    std::string describe() const override { return endpoint_.url(); }

private:
    ShutdownEndpoint endpoint_;
};

} // namespace siri_desktop

#pragma once

#include <string>
#include <exception>
#include <nlohmann/json.hpp>

namespace siri {

using json = nlohmann::json;

// Error types as constants
namespace ErrorType {
    constexpr const char* PROCESS_ERROR = "process_error";
    constexpr const char* NETWORK_ERROR = "network_error";
    constexpr const char* UPDATE_ERROR = "update_error";
    constexpr const char* PRINTER_ERROR = "printer_error";
    constexpr const char* INVALID_REQUEST = "invalid_request";
    constexpr const char* UNKNOWN_COMMAND = "unknown_command";
    constexpr const char* UNSUPPORTED_OPERATION = "unsupported_operation";
    constexpr const char* SIGNATURE_ERROR = "signature_error";
    constexpr const char* FORBIDDEN = "forbidden";
    constexpr const char* FILE_ERROR = "file_error";
    constexpr const char* INTERNAL_ERROR = "internal_error";
}

// Base exception class for all shell errors
class ShellException : public std::exception {
public:
    ShellException(const std::string& message, const std::string& type = ErrorType::INTERNAL_ERROR)
        : message_(message), type_(type) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    const std::string& type() const { return type_; }

    virtual json to_json() const {
        return {
            {"error", {
                {"message", message_},
                {"type", type_}
            }}
        };
    }

protected:
    std::string message_;
    std::string type_;
};

// Specific exception types
class ProcessException : public ShellException {
public:
    ProcessException(const std::string& executable, const std::string& message)
        : ShellException("Failed to start '" + executable + "': " + message, ErrorType::PROCESS_ERROR),
          executable_(executable) {}

    const std::string& executable() const { return executable_; }

private:
    std::string executable_;
};

class NetworkException : public ShellException {
public:
    NetworkException(const std::string& message, int status_code = 0)
        : ShellException("Network error: " + message, ErrorType::NETWORK_ERROR),
          status_code_(status_code) {}

    int status_code() const { return status_code_; }

    json to_json() const override {
        auto j = ShellException::to_json();
        if (status_code_ > 0) {
            j["error"]["status_code"] = status_code_;
        }
        return j;
    }

private:
    int status_code_;
};

class UpdateException : public ShellException {
public:
    UpdateException(const std::string& message)
        : ShellException(message, ErrorType::UPDATE_ERROR) {}
};

class SignatureException : public ShellException {
public:
    SignatureException(const std::string& message)
        : ShellException(message, ErrorType::SIGNATURE_ERROR) {}
};

class PrinterException : public ShellException {
public:
    PrinterException(const std::string& message)
        : ShellException(message, ErrorType::PRINTER_ERROR) {}
};

class InvalidRequestException : public ShellException {
public:
    InvalidRequestException(const std::string& message)
        : ShellException("Invalid request: " + message, ErrorType::INVALID_REQUEST) {}
};

class UnknownCommandException : public ShellException {
public:
    UnknownCommandException(const std::string& command)
        : ShellException("Unknown command '" + command + "'", ErrorType::UNKNOWN_COMMAND) {}
};

class UnsupportedOperationException : public ShellException {
public:
    UnsupportedOperationException(const std::string& operation, const std::string& platform = "")
        : ShellException(operation + " is not supported" + (platform.empty() ? "" : " on " + platform),
                        ErrorType::UNSUPPORTED_OPERATION) {}
};

// Helper class for consistent error responses
class ErrorResponse {
public:
    static json create(const std::string& message,
                      const std::string& type = ErrorType::INTERNAL_ERROR,
                      const json& details = {}) {
        json error = {
            {"error", {
                {"message", message},
                {"type", type}
            }}
        };

        if (!details.empty()) {
            error["error"]["details"] = details;
        }

        return error;
    }

    static json from_exception(const ShellException& e) {
        return e.to_json();
    }

    static json from_std_exception(const std::exception& e,
                                   const std::string& type = ErrorType::INTERNAL_ERROR) {
        return create(e.what(), type);
    }
};

} // namespace siri

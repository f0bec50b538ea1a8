#pragma once

#include <string>
#include <exception>
#include <nlohmann/json.hpp>

namespace pipali {

using json = nlohmann::json;

// Error types as constants
namespace ErrorType {
    constexpr const char* RESOLUTION_ERROR = "resolution_error";
    constexpr const char* INSTALLATION_ERROR = "installation_error";
    constexpr const char* SPAWN_ERROR = "spawn_error";
    constexpr const char* READINESS_TIMEOUT = "readiness_timeout";
    constexpr const char* STOP_ERROR = "stop_error";
    constexpr const char* INTERNAL_ERROR = "internal_error";
}

// Base exception class for all supervisor errors
class PipaliException : public std::exception {
public:
    PipaliException(const std::string& message, const std::string& type = ErrorType::INTERNAL_ERROR)
        : message_(message), type_(type) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    const std::string& type() const { return type_; }

    json to_json() const {
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

// Data directory or resource paths could not be determined or created
class ResolutionException : public PipaliException {
public:
    ResolutionException(const std::string& message)
        : PipaliException(message, ErrorType::RESOLUTION_ERROR) {}
};

// A bundled file the sidecar needs is missing
class InstallationException : public PipaliException {
public:
    InstallationException(const std::string& path)
        : PipaliException("Server entry point not found at " + path +
                          " (the installation may be corrupted)",
                          ErrorType::INSTALLATION_ERROR),
          path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class SpawnException : public PipaliException {
public:
    SpawnException(const std::string& message)
        : PipaliException("Failed to spawn sidecar: " + message, ErrorType::SPAWN_ERROR) {}
};

class ReadinessTimeoutException : public PipaliException {
public:
    ReadinessTimeoutException(int attempts)
        : PipaliException("Sidecar failed to become ready within timeout (" +
                          std::to_string(attempts) + " attempts)",
                          ErrorType::READINESS_TIMEOUT),
          attempts_(attempts) {}

    int attempts() const { return attempts_; }

private:
    int attempts_;
};

class StopException : public PipaliException {
public:
    StopException(const std::string& message)
        : PipaliException("Failed to kill sidecar: " + message, ErrorType::STOP_ERROR) {}
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

    static json from_exception(const PipaliException& e) {
        return e.to_json();
    }

    static json from_std_exception(const std::exception& e,
                                   const std::string& type = ErrorType::INTERNAL_ERROR) {
        return create(e.what(), type);
    }
};

} // namespace pipali

/**
 * codebox Service Errors
 *
 * Every failure the service reports to a caller is a ServiceError tagged
 * with one ErrorKind. The dispatcher maps kinds to wire error codes.
 */
#pragma once
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace codebox {

enum class ErrorKind {
    INVALID_REQUEST,   // Malformed envelope
    METHOD_NOT_FOUND,
    INVALID_PARAMS,
    VALIDATION,        // Code rejected by policy, no sandbox touched
    COMPILATION,       // Structured diagnostic, carried in data
    RUNTIME,           // Sandbox provisioning/exec failure or timeout
    SESSION_EXPIRED,   // Stale handle, caller should start a new session
    INTERNAL
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_REQUEST:  return "invalid_request";
        case ErrorKind::METHOD_NOT_FOUND: return "method_not_found";
        case ErrorKind::INVALID_PARAMS:   return "invalid_params";
        case ErrorKind::VALIDATION:       return "validation_error";
        case ErrorKind::COMPILATION:      return "compilation_error";
        case ErrorKind::RUNTIME:          return "runtime_error";
        case ErrorKind::SESSION_EXPIRED:  return "session_expired";
        case ErrorKind::INTERNAL:         return "internal_error";
        default: return "internal_error";
    }
}

class ServiceError : public std::runtime_error {
public:
    ServiceError(ErrorKind kind, const std::string& message,
                 nlohmann::json data = nullptr)
        : std::runtime_error(message), kind_(kind), data_(std::move(data)) {}

    ErrorKind kind() const { return kind_; }
    const nlohmann::json& data() const { return data_; }

private:
    ErrorKind kind_;
    nlohmann::json data_;
};

} // namespace codebox

/**
 * codebox Wire Protocol
 *
 * JSON-RPC 2.0 over Content-Length framed stdio.
 * Frame: "Content-Length: <n>\r\n\r\n" followed by n bytes of JSON.
 */
#pragma once
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include "util/errors.hpp"

namespace codebox::rpc {

constexpr const char* JSONRPC_VERSION = "2.0";
constexpr size_t MAX_BODY_SIZE = 64 * 1024 * 1024; // 64MB max

// Error codes
constexpr int PARSE_ERROR      = -32700;  // Body is not JSON
constexpr int INVALID_REQUEST  = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS   = -32602;
constexpr int INTERNAL_ERROR   = -32603;
constexpr int EXECUTION_ERROR  = -32000;  // Sandbox/runtime failure, session expiry
constexpr int VALIDATION_ERROR = -32001;
constexpr int COMPILATION_ERROR = -32002;

enum class Method {
    EXECUTE,          // Transient run
    EXECUTE_SESSION,  // Run inside a persistent session
    CLEANUP_SESSION,
    UNKNOWN
};

inline Method method_from_string(const std::string& name) {
    if (name == "execute") return Method::EXECUTE;
    if (name == "execute-session") return Method::EXECUTE_SESSION;
    if (name == "cleanup-session") return Method::CLEANUP_SESSION;
    return Method::UNKNOWN;
}

inline const char* method_to_string(Method method) {
    switch (method) {
        case Method::EXECUTE:         return "execute";
        case Method::EXECUTE_SESSION: return "execute-session";
        case Method::CLEANUP_SESSION: return "cleanup-session";
        default: return "unknown";
    }
}

inline int error_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_REQUEST:  return INVALID_REQUEST;
        case ErrorKind::METHOD_NOT_FOUND: return METHOD_NOT_FOUND;
        case ErrorKind::INVALID_PARAMS:   return INVALID_PARAMS;
        case ErrorKind::VALIDATION:       return VALIDATION_ERROR;
        case ErrorKind::COMPILATION:      return COMPILATION_ERROR;
        case ErrorKind::RUNTIME:          return EXECUTION_ERROR;
        case ErrorKind::SESSION_EXPIRED:  return EXECUTION_ERROR;
        case ErrorKind::INTERNAL:         return INTERNAL_ERROR;
        default: return INTERNAL_ERROR;
    }
}

inline nlohmann::json make_result(const nlohmann::json& id, nlohmann::json result) {
    return {
        {"jsonrpc", JSONRPC_VERSION},
        {"id", id},
        {"result", std::move(result)}
    };
}

inline nlohmann::json make_error(const nlohmann::json& id, int code, const std::string& message,
                                 const nlohmann::json& data = nullptr) {
    nlohmann::json error = {
        {"code", code},
        {"message", message}
    };
    if (!data.is_null()) {
        error["data"] = data;
    }
    return {
        {"jsonrpc", JSONRPC_VERSION},
        {"id", id},
        {"error", error}
    };
}

inline nlohmann::json make_error(const nlohmann::json& id, const ServiceError& e) {
    return make_error(id, error_code_for(e.kind()), e.what(), e.data());
}

} // namespace codebox::rpc

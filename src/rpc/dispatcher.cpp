#include "rpc/dispatcher.hpp"
#include "util/errors.hpp"
#include "util/ids.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace codebox::rpc {

namespace {

// Required non-empty string parameter
std::string require_string(const json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        throw ServiceError(ErrorKind::INVALID_PARAMS, std::string("Missing required parameter: ") + key);
    }
    if (!it->is_string() || it->get_ref<const std::string&>().empty()) {
        throw ServiceError(ErrorKind::INVALID_PARAMS, std::string("Parameter must be a non-empty string: ") + key);
    }
    return it->get<std::string>();
}

bool valid_id(const json& id) {
    return id.is_null() || id.is_string() || id.is_number();
}

} // namespace

Dispatcher::Dispatcher(session::SessionManager& sessions, config::ProtocolConfig protocol)
    : sessions_(sessions), protocol_(protocol) {}

json Dispatcher::dispatch(const json& request) {
    if (!request.is_object()) {
        return make_error(nullptr, INVALID_REQUEST, "Invalid Request: expected an object");
    }

    json id = request.contains("id") ? request["id"] : json(nullptr);
    if (!valid_id(id)) {
        return make_error(nullptr, INVALID_REQUEST, "Invalid Request: id must be a string, number or null");
    }

    auto method_it = request.find("method");
    if (method_it == request.end() || !method_it->is_string() ||
        method_it->get_ref<const std::string&>().empty()) {
        return make_error(id, INVALID_REQUEST, "Invalid Request: method must be a non-empty string");
    }
    const std::string& name = method_it->get_ref<const std::string&>();

    json params = json::object();
    if (request.contains("params") && !request["params"].is_null()) {
        params = request["params"];
        if (!params.is_object()) {
            return make_error(id, INVALID_PARAMS, "Invalid params: expected an object");
        }
    }

    Method method = method_from_string(name);
    spdlog::debug("Request {} -> {}", id.dump(), name);

    try {
        switch (method) {
            case Method::EXECUTE:
                return make_result(id, handle_execute(params));

            case Method::EXECUTE_SESSION:
                return make_result(id, handle_execute_session(params));

            case Method::CLEANUP_SESSION:
                return make_result(id, handle_cleanup_session(params));

            default:
                spdlog::warn("Unknown method: {}", name);
                return make_error(id, METHOD_NOT_FOUND, "Method not found: " + name);
        }
    } catch (const ServiceError& e) {
        spdlog::debug("{} failed ({}): {}", name, error_kind_to_string(e.kind()), e.what());
        return make_error(id, e);
    } catch (const std::exception& e) {
        spdlog::error("Internal error handling {}: {}", name, e.what());
        return make_error(id, INTERNAL_ERROR, std::string("Internal error: ") + e.what());
    }
}

// ============================================================================
// Handlers
// ============================================================================

json Dispatcher::execution_response(const session::ExecutionResult& result) const {
    if (protocol_.diagnostics_as_errors && result.diagnostic) {
        json data = result.diagnostic->to_json();
        data["output"] = result.output;
        data["exit_code"] = result.exit_code;
        if (result.session_id) {
            data["session_id"] = *result.session_id;
        }
        throw ServiceError(ErrorKind::COMPILATION, result.diagnostic->message, data);
    }
    return result.to_json();
}

json Dispatcher::handle_execute(const json& params) {
    std::string code = require_string(params, "code");
    return execution_response(sessions_.run_transient(code));
}

json Dispatcher::handle_execute_session(const json& params) {
    std::string code = require_string(params, "code");

    std::string session_id;
    if (params.contains("session_id") && !params["session_id"].is_null()) {
        session_id = require_string(params, "session_id");
    } else {
        session_id = util::uuid4();
        spdlog::info("Starting new session {}", session_id);
    }

    auto result = sessions_.run_persistent(session_id, code);
    result.session_id = session_id;
    return execution_response(result);
}

json Dispatcher::handle_cleanup_session(const json& params) {
    std::string session_id = require_string(params, "session_id");
    return sessions_.cleanup(session_id).to_json();
}

} // namespace codebox::rpc

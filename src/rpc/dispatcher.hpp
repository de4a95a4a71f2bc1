/**
 * codebox Request Dispatcher
 *
 * Validates JSON-RPC envelopes, routes them to the session manager and turns
 * every outcome into exactly one response object.
 */
#pragma once
#include <nlohmann/json.hpp>
#include "config/config.hpp"
#include "rpc/protocol.hpp"
#include "session/session_manager.hpp"

namespace codebox::rpc {

class Dispatcher {
public:
    Dispatcher(session::SessionManager& sessions, config::ProtocolConfig protocol = {});

    // Never throws; the response carries either `result` or `error`
    nlohmann::json dispatch(const nlohmann::json& request);

private:
    session::SessionManager& sessions_;
    config::ProtocolConfig protocol_;

    nlohmann::json handle_execute(const nlohmann::json& params);
    nlohmann::json handle_execute_session(const nlohmann::json& params);
    nlohmann::json handle_cleanup_session(const nlohmann::json& params);

    // Result JSON, or a COMPILATION error when diagnostics are reported as errors
    nlohmann::json execution_response(const session::ExecutionResult& result) const;
};

} // namespace codebox::rpc

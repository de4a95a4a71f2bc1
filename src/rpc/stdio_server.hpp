/**
 * codebox Stdio Server
 *
 * Request loop over a pair of streams: read one frame, dispatch it, write
 * the response, repeat until end of input.
 */
#pragma once
#include <atomic>
#include <istream>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include "rpc/dispatcher.hpp"

namespace codebox::rpc {

enum class ServerState {
    AWAITING_HEADER,
    AWAITING_BODY,
    DISPATCHING,
    RESPONDING,
    STOPPED
};

const char* server_state_to_string(ServerState state);

class StdioServer {
public:
    StdioServer(Dispatcher& dispatcher, std::istream& in, std::ostream& out);

    // Serve until EOF, a framing error, a failed write or stop()
    void run();

    // Checked between requests
    void stop() { running_ = false; }

    ServerState state() const { return state_; }
    size_t requests_handled() const { return requests_handled_; }

    // Parse a frame body and dispatch it; non-JSON bodies yield -32700
    nlohmann::json handle_body(const std::string& body);

private:
    Dispatcher& dispatcher_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> running_{false};
    ServerState state_ = ServerState::STOPPED;
    size_t requests_handled_ = 0;
};

} // namespace codebox::rpc

#include "rpc/stdio_server.hpp"
#include "rpc/framing.hpp"
#include "rpc/protocol.hpp"
#include <spdlog/spdlog.h>

#include <optional>

using json = nlohmann::json;

namespace codebox::rpc {

const char* server_state_to_string(ServerState state) {
    switch (state) {
        case ServerState::AWAITING_HEADER: return "AWAITING_HEADER";
        case ServerState::AWAITING_BODY:   return "AWAITING_BODY";
        case ServerState::DISPATCHING:     return "DISPATCHING";
        case ServerState::RESPONDING:      return "RESPONDING";
        case ServerState::STOPPED:         return "STOPPED";
        default: return "UNKNOWN";
    }
}

StdioServer::StdioServer(Dispatcher& dispatcher, std::istream& in, std::ostream& out)
    : dispatcher_(dispatcher), in_(in), out_(out) {}

json StdioServer::handle_body(const std::string& body) {
    json request;
    try {
        request = json::parse(body);
    } catch (const json::parse_error& e) {
        spdlog::warn("Request body is not JSON: {}", e.what());
        return make_error(nullptr, PARSE_ERROR, std::string("Parse error: ") + e.what());
    }

    try {
        return dispatcher_.dispatch(request);
    } catch (const std::exception& e) {
        spdlog::error("Dispatch failed: {}", e.what());
        json id = request.is_object() && request.contains("id") ? request["id"] : json(nullptr);
        return make_error(id, INTERNAL_ERROR, std::string("Internal error: ") + e.what());
    }
}

void StdioServer::run() {
    running_ = true;
    state_ = ServerState::AWAITING_HEADER;
    spdlog::info("Serving JSON-RPC on stdio");

    std::optional<size_t> length;
    std::string body;
    json response;

    // stop() is honoured between requests only, so a request already read is answered
    bool serving = true;
    while (serving) {
        switch (state_) {
            case ServerState::AWAITING_HEADER:
                if (!running_) {
                    serving = false;
                    break;
                }
                length = read_header(in_);
                if (!length) {
                    spdlog::info("Input closed, stopping");
                    serving = false;
                    break;
                }
                state_ = ServerState::AWAITING_BODY;
                break;

            case ServerState::AWAITING_BODY: {
                auto received = read_body(in_, *length);
                if (!received) {
                    serving = false;
                    break;
                }
                body = std::move(*received);
                state_ = ServerState::DISPATCHING;
                break;
            }

            case ServerState::DISPATCHING:
                response = handle_body(body);
                state_ = ServerState::RESPONDING;
                break;

            case ServerState::RESPONDING: {
                // Invalid UTF-8 in tool output is replaced rather than failing the write
                std::string payload = response.dump(-1, ' ', false, json::error_handler_t::replace);
                if (!write_frame(out_, payload)) {
                    spdlog::error("Failed to write response, stopping");
                    serving = false;
                    break;
                }
                requests_handled_++;
                state_ = ServerState::AWAITING_HEADER;
                break;
            }

            default:
                serving = false;
                break;
        }
    }

    running_ = false;
    state_ = ServerState::STOPPED;
    spdlog::info("Server stopped after {} request(s)", requests_handled_);
}

} // namespace codebox::rpc

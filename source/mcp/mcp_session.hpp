#ifndef EDMCPS_MCP_SESSION_HPP
#define EDMCPS_MCP_SESSION_HPP

// MCP session: the JSON-RPC lifecycle for one client.
//
// Uninitialized -> Initializing (initialize answered) -> Initialized
// (notifications/initialized received) -> Terminated (end of input).
// Requests are handled strictly one at a time; every request gets exactly
// one response and no notification is ever answered.

#include <nlohmann/json.hpp>
#include <string>

#include "protocol/json_rpc.hpp"
#include "session/session_context.hpp"
#include "studio/studio_api.hpp"

namespace mcp_session {

using json = nlohmann::json;

// Protocol version we speak when the client asks for one we don't know.
extern const char *const PROTOCOL_VERSION;

enum class State {
    Uninitialized,
    Initializing,
    Initialized,
    Terminated
};

const char *state_name(State state);

class Session {
public:
    explicit Session(studio_api::Studio &studio);

    // Handles one parsed message. Returns the response, or a null json value
    // when nothing must be sent (notifications).
    json handle_message(const json &message);

    // Parses one input line and handles it. Unparseable text yields a
    // -32700 response with a null id.
    json handle_line(const std::string &line);

    void terminate();

    State state() const { return state_; }

    // Context as of the end of the last tools/call.
    const session_context::SessionContext &context() const { return context_; }

private:
    json handle_request(const json_rpc::Envelope &envelope);
    void handle_notification(const json_rpc::Envelope &envelope);

    json handle_initialize(const json &request_id, const json &params);
    json handle_tools_list(const json &request_id);
    json handle_tools_call(const json &request_id, const json &params);

    studio_api::Studio &studio_;
    State state_ = State::Uninitialized;
    session_context::SessionContext context_;
};

} // namespace mcp_session

#endif // EDMCPS_MCP_SESSION_HPP

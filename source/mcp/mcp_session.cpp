#include "mcp/mcp_session.hpp"

#include <string>

#include "mcp/mcp_tools.hpp"
#include "router/tool_router.hpp"
#include "tool_handlers/handler_outcome.hpp"
#include "utils/debug_log.hpp"

namespace mcp_session {

const char *const PROTOCOL_VERSION = "2024-11-05";

// Versions a client may ask for that we answer with unchanged.
static const char *const kKnownProtocolVersions[] = {
    "2024-11-05",
    "2025-03-26",
    "2025-06-18",
};

static const std::string SERVER_NAME = "edmcps";
static const std::string SERVER_VERSION = "0.1.0";
// Description so that MCP clients can tell this server drives an editing
// application and suggest it for project, timeline and media work.
static const std::string SERVER_DESCRIPTION =
    "Editor MCP server: controls a video editing application. Use this server "
    "to create and open projects, create, switch and delete timelines, import "
    "media, create bins, add markers and switch pages. Tools include "
    "create_project, create_empty_timeline, list_timelines, set_current_timeline, "
    "import_media and add_marker.";

const char *state_name(State state) {
    switch (state) {
    case State::Uninitialized:
        return "uninitialized";
    case State::Initializing:
        return "initializing";
    case State::Initialized:
        return "initialized";
    case State::Terminated:
        return "terminated";
    }
    return "uninitialized";
}

static std::string negotiate_version(const json &params) {
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        std::string requested = params["protocolVersion"].get<std::string>();
        for (const char *known : kKnownProtocolVersions) {
            if (requested == known) {
                return requested;
            }
        }
        debug_log::info("client requested unknown protocol version " + requested + ", offering " +
                        PROTOCOL_VERSION);
    }
    return PROTOCOL_VERSION;
}

Session::Session(studio_api::Studio &studio) : studio_(studio) {}

json Session::handle_line(const std::string &line) {
    json message;
    try {
        message = json::parse(line);
    } catch (const json::parse_error &error) {
        debug_log::warn(std::string("failed to parse incoming JSON: ") + error.what());
        return json_rpc::build_error_response(nullptr, json_rpc::PARSE_ERROR, "Parse error");
    }
    return handle_message(message);
}

json Session::handle_message(const json &message) {
    json_rpc::Envelope envelope = json_rpc::parse_envelope(message);

    switch (envelope.kind) {
    case json_rpc::EnvelopeKind::Invalid:
        // A notification is never answered, even a malformed one.
        if (json_rpc::is_notification(message) && !envelope.method.empty()) {
            debug_log::log("dropping malformed notification " + envelope.method + ": " + envelope.error_message);
            return nullptr;
        }
        debug_log::log("rejected message: " + envelope.error_message);
        return json_rpc::build_error_response(envelope.id, envelope.error_code, envelope.error_message);
    case json_rpc::EnvelopeKind::Notification:
        handle_notification(envelope);
        return nullptr;
    case json_rpc::EnvelopeKind::Request:
        break;
    }
    return handle_request(envelope);
}

void Session::terminate() {
    if (state_ != State::Terminated) {
        debug_log::log(std::string("session terminated from state ") + state_name(state_));
    }
    state_ = State::Terminated;
}

void Session::handle_notification(const json_rpc::Envelope &envelope) {
    if (envelope.method == "notifications/initialized") {
        if (state_ == State::Initializing) {
            state_ = State::Initialized;
            debug_log::log("client confirmed initialization");
        } else {
            debug_log::log(std::string("ignoring notifications/initialized in state ") + state_name(state_));
        }
        return;
    }
    debug_log::log("ignoring notification " + envelope.method);
}

json Session::handle_request(const json_rpc::Envelope &envelope) {
    const json &request_id = envelope.id;
    const std::string &method = envelope.method;

    if (state_ == State::Terminated) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_REQUEST, "Session terminated");
    }

    if (method == "initialize") {
        if (state_ != State::Uninitialized) {
            return json_rpc::build_error_response(request_id, json_rpc::INVALID_REQUEST,
                                                   "Server already initialized");
        }
        return handle_initialize(request_id, envelope.params);
    }

    if (method == "ping") {
        return json_rpc::build_response(request_id, json::object());
    }

    if (state_ == State::Uninitialized) {
        return json_rpc::build_error_response(request_id, json_rpc::SERVER_NOT_INITIALIZED,
                                               "Server not initialized");
    }

    if (method == "tools/list") {
        return handle_tools_list(request_id);
    }
    if (method == "tools/call") {
        return handle_tools_call(request_id, envelope.params);
    }

    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND, "Method not found: " + method);
}

json Session::handle_initialize(const json &request_id, const json &params) {
    json capabilities;
    capabilities["tools"] = json::object();

    json server_info;
    server_info["name"] = SERVER_NAME;
    server_info["version"] = SERVER_VERSION;
    server_info["description"] = SERVER_DESCRIPTION;

    json result;
    result["protocolVersion"] = negotiate_version(params);
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;

    if (params.contains("clientInfo") && params["clientInfo"].is_object() &&
        params["clientInfo"].contains("name") && params["clientInfo"]["name"].is_string()) {
        debug_log::info("initialize from client " + params["clientInfo"]["name"].get<std::string>());
    }

    state_ = State::Initializing;
    return json_rpc::build_response(request_id, result);
}

json Session::handle_tools_list(const json &request_id) {
    return json_rpc::build_response(request_id, mcp_tools::build_tools_list_response());
}

json Session::handle_tools_call(const json &request_id, const json &params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                               "Missing or invalid 'name' in tools/call");
    }
    std::string tool_name = params["name"].get<std::string>();

    json arguments = json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        if (!params["arguments"].is_object()) {
            return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                                   "Invalid 'arguments' in tools/call: must be an object");
        }
        arguments = params["arguments"];
    }

    if (debug_log::is_debug_enabled()) {
        debug_log::log("tools/call " + tool_name + " arguments: " +
                       arguments.dump(-1, ' ', false, json::error_handler_t::replace));
    }

    std::optional<mcp_tools::ToolDefinition> tool = mcp_tools::find_tool(tool_name);
    if (!tool) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS, "Unknown tool: " + tool_name);
    }

    // The application may have changed since the last call; start from its state.
    session_context::RefreshedContext refreshed = session_context::refresh_context(studio_);
    context_ = refreshed.context();

    handler_outcome::Outcome outcome = tool_router::route_call(studio_, refreshed, *tool, arguments);
    if (outcome.updated_context) {
        context_ = *outcome.updated_context;
    }

    if (outcome.success) {
        debug_log::log("tools/call " + tool_name + " succeeded");
    } else {
        debug_log::info("tools/call " + tool_name + " failed: " + outcome.message);
    }
    return json_rpc::build_response(request_id, handler_outcome::to_tool_result(outcome));
}

} // namespace mcp_session

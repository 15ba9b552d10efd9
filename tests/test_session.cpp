// Tests for the MCP session lifecycle, driven line by line the way the stdio
// loop feeds it, plus the create/list/delete scenario end to end.

#include "mcp/mcp_session.hpp"
#include "mcp/mcp_stdio.hpp"
#include "studio/sim/sim_studio.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace test_session {

static bool report(bool success, const std::string &description, const std::string &failure_detail) {
    if (success) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << ": " << failure_detail << std::endl;
    }
    return success;
}

static json request(int id, const std::string &method, const json &params = json::object()) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

static json tool_call(int id, const std::string &tool_name, const json &arguments) {
    return request(id, "tools/call", {{"name", tool_name}, {"arguments", arguments}});
}

static json initialize_request(int id) {
    return request(id, "initialize",
                   {{"protocolVersion", "2024-11-05"},
                    {"capabilities", json::object()},
                    {"clientInfo", {{"name", "edmcps-tests"}, {"version", "1.0"}}}});
}

static const json kInitializedNotification = {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}};

static std::string first_text(const json &response) {
    if (!response.contains("result") || !response["result"].contains("content") ||
        response["result"]["content"].empty()) {
        return "";
    }
    return response["result"]["content"][0]["text"].get<std::string>();
}

static bool is_tool_error(const json &response) {
    return response.contains("result") && response["result"]["is_error"] == true;
}

// Throws a value that is not a std::exception from chosen entry points.
class ThrowingStudio : public studio_sim::SimStudio {
public:
    bool throw_from_open_page = false;
    bool throw_from_project_manager = false;

    bool open_page(const std::string &page) override {
        if (throw_from_open_page) {
            throw 42;
        }
        return SimStudio::open_page(page);
    }

    std::optional<studio_api::ProjectManagerHandle> get_project_manager() override {
        if (throw_from_project_manager) {
            throw 42;
        }
        return SimStudio::get_project_manager();
    }
};

// Test: Only initialize is accepted first; other requests get -32002.
static bool test_requests_before_initialize() {
    studio_sim::SimStudio studio;
    mcp_session::Session session(studio);
    json listed = session.handle_message(request(1, "tools/list"));
    json called = session.handle_message(tool_call(2, "is_running", json::object()));
    bool success = listed["error"]["code"] == json_rpc::SERVER_NOT_INITIALIZED && listed["id"] == 1 &&
                   called["error"]["code"] == json_rpc::SERVER_NOT_INITIALIZED && called["id"] == 2 &&
                   session.state() == mcp_session::State::Uninitialized;
    return report(success, "requests before initialize are protocol errors", listed.dump());
}

// Test: initialize answers with version, capabilities and server info, echoing the id.
static bool test_initialize_response() {
    studio_sim::SimStudio studio;
    mcp_session::Session session(studio);
    json response = session.handle_message(initialize_request(11));
    json unknown_version = mcp_session::Session(studio).handle_message(
        request(12, "initialize", {{"protocolVersion", "1999-01-01"}}));
    bool success = response["id"] == 11 && response["result"]["protocolVersion"] == "2024-11-05" &&
                   response["result"]["capabilities"].contains("tools") &&
                   response["result"]["serverInfo"]["name"] == "edmcps" &&
                   session.state() == mcp_session::State::Initializing &&
                   unknown_version["result"]["protocolVersion"] == mcp_session::PROTOCOL_VERSION;
    return report(success, "initialize reports version, capabilities and server info", response.dump());
}

// Test: The initialized notification gets no response and completes the handshake.
static bool test_initialized_notification() {
    studio_sim::SimStudio studio;
    mcp_session::Session session(studio);
    session.handle_message(initialize_request(1));
    json response = session.handle_message(kInitializedNotification);
    json again = session.handle_message(initialize_request(2));
    bool success = response.is_null() && session.state() == mcp_session::State::Initialized &&
                   again["error"]["code"] == json_rpc::INVALID_REQUEST;
    return report(success, "notifications/initialized is silent and a second initialize is refused",
                  again.dump());
}

// Test: Notifications are never answered, whatever the state.
static bool test_notifications_never_answered() {
    studio_sim::SimStudio studio;
    mcp_session::Session session(studio);
    json early = session.handle_message(kInitializedNotification);
    json unknown = session.handle_message({{"jsonrpc", "2.0"}, {"method", "notifications/cancelled"}});
    bool success = early.is_null() && unknown.is_null() && session.state() == mcp_session::State::Uninitialized;
    return report(success, "notifications produce no output", early.dump() + unknown.dump());
}

// Test: A malformed notification is dropped without a reply.
static bool test_malformed_notification_dropped() {
    studio_sim::SimStudio studio;
    mcp_session::Session session(studio);
    session.handle_message(initialize_request(1));
    json dropped = session.handle_line(R"({"jsonrpc":"2.0","method":"notifications/initialized","params":[]})");
    json answered = session.handle_line(R"({"jsonrpc":"2.0","id":2,"method":"tools/list","params":[]})");
    bool success = dropped.is_null() && session.state() == mcp_session::State::Initializing &&
                   answered["error"]["code"] == json_rpc::INVALID_PARAMS && answered["id"] == 2;
    return report(success, "malformed notifications get no response", dropped.dump() + answered.dump());
}

// Test: Malformed input gets the right error and the session keeps going.
static bool test_protocol_errors() {
    studio_sim::SimStudio studio;
    mcp_session::Session session(studio);
    session.handle_message(initialize_request(1));
    session.handle_message(kInitializedNotification);

    json parse_error = session.handle_line("{\"jsonrpc\": \"2.0\", \"id\": 5,");
    json wrong_version = session.handle_line(R"({"jsonrpc":"1.0","id":6,"method":"tools/list"})");
    json unknown_method = session.handle_message(request(7, "resources/list"));
    json no_name = session.handle_message(request(8, "tools/call", {{"arguments", json::object()}}));
    json bad_arguments = session.handle_message(request(9, "tools/call", {{"name", "create_bin"}, {"arguments", 3}}));
    json unknown_tool = session.handle_message(tool_call(10, "make_coffee", json::object()));
    json still_alive = session.handle_message(request(11, "ping"));

    bool success = parse_error["error"]["code"] == json_rpc::PARSE_ERROR && parse_error["id"].is_null() &&
                   wrong_version["error"]["code"] == json_rpc::INVALID_REQUEST && wrong_version["id"] == 6 &&
                   unknown_method["error"]["code"] == json_rpc::METHOD_NOT_FOUND &&
                   no_name["error"]["code"] == json_rpc::INVALID_PARAMS &&
                   bad_arguments["error"]["code"] == json_rpc::INVALID_PARAMS &&
                   unknown_tool["error"]["code"] == json_rpc::INVALID_PARAMS && unknown_tool["id"] == 10 &&
                   still_alive["id"] == 11 && still_alive["result"].is_object();
    return report(success, "protocol errors are per-request and the session continues", unknown_tool.dump());
}

// Test: Tool calls are accepted once initialize has been answered.
static bool test_tools_after_initialize_response() {
    studio_sim::SimStudio studio;
    mcp_session::Session session(studio);
    session.handle_message(initialize_request(1));
    json listed = session.handle_message(request(2, "tools/list"));
    bool success = listed["result"]["tools"].is_array() && !listed["result"]["tools"].empty();
    return report(success, "tools/list works before the initialized notification arrives", listed.dump());
}

// Test: A failing tool is a tool-level error inside a normal result.
static bool test_tool_failure_is_not_rpc_error() {
    studio_sim::SimStudio studio;
    mcp_session::Session session(studio);
    session.handle_message(initialize_request(1));
    session.handle_message(kInitializedNotification);
    json response = session.handle_message(tool_call(2, "delete_timeline", {{"name", "A"}}));
    json missing_argument = session.handle_message(tool_call(3, "create_project", json::object()));
    bool success = !response.contains("error") && is_tool_error(response) &&
                   response["result"]["isError"] == true && is_tool_error(missing_argument);
    return report(success, "tool failures are reported with is_error", response.dump());
}

// Test: After terminate, requests are refused.
static bool test_terminated_session() {
    studio_sim::SimStudio studio;
    mcp_session::Session session(studio);
    session.handle_message(initialize_request(1));
    session.terminate();
    json response = session.handle_message(request(2, "tools/list"));
    bool success = session.state() == mcp_session::State::Terminated &&
                   response["error"]["code"] == json_rpc::INVALID_REQUEST && response["id"] == 2;
    return report(success, "a terminated session refuses requests", response.dump());
}

// Test: The session context follows create_project, set_current_timeline and close_project.
static bool test_context_tracks_calls() {
    studio_sim::SimStudio studio;
    mcp_session::Session session(studio);
    session.handle_message(initialize_request(1));
    session.handle_message(tool_call(2, "create_project", {{"name", "T"}}));
    bool project_open = session.context().current_project && session.context().current_media_pool;
    session.handle_message(tool_call(3, "create_timeline", {{"name", "A"}}));
    session.handle_message(tool_call(4, "set_current_timeline", {{"name", "A"}}));
    bool timeline_set = session.context().current_timeline &&
                        (*session.context().current_timeline)->get_name() == "A";
    session.handle_message(tool_call(5, "close_project", json::object()));
    bool cleared = !session.context().current_project && !session.context().current_timeline;
    return report(project_open && timeline_set && cleared, "session context follows the calls that move it",
                  std::to_string(project_open) + std::to_string(timeline_set) + std::to_string(cleared));
}

// Test: initialize, create project, create/list/delete/list a timeline over the wire.
static bool test_end_to_end_scenario() {
    studio_sim::SimStudio studio;
    mcp_session::Session session(studio);

    std::vector<json> messages = {
        initialize_request(1),
        kInitializedNotification,
        tool_call(2, "create_project", {{"name", "T"}}),
        tool_call(3, "create_empty_timeline",
                  {{"name", "A"}, {"frame_rate", "24"}, {"resolution_width", 1920}, {"resolution_height", 1080}}),
        tool_call(4, "list_timelines_tool", json::object()),
        tool_call(5, "delete_timeline", {{"name", "A"}}),
        tool_call(6, "list_timelines_tool", json::object()),
    };

    std::ostringstream input_stream;
    for (const auto &message : messages) {
        input_stream << message.dump() << "\n\n";
    }
    std::istringstream input(input_stream.str());
    std::ostringstream output;
    while (std::optional<std::string> line = mcp_stdio::read_message(input)) {
        json response = session.handle_line(*line);
        if (!response.is_null()) {
            mcp_stdio::write_message(output, response.dump());
        }
    }
    session.terminate();

    std::vector<json> responses;
    std::istringstream output_lines(output.str());
    while (std::optional<std::string> line = mcp_stdio::read_message(output_lines)) {
        responses.push_back(json::parse(*line));
    }
    if (responses.size() != 6) {
        return report(false, "end-to-end scenario", "expected 6 responses, got " + std::to_string(responses.size()));
    }

    bool ids_in_order = true;
    for (size_t index = 0; index < responses.size(); index++) {
        ids_in_order &= responses[index]["id"] == static_cast<int>(index + 1);
    }
    bool created_project = !is_tool_error(responses[1]) && first_text(responses[1]).find("T") != std::string::npos;
    bool created_timeline = !is_tool_error(responses[2]);
    bool listed_before = !is_tool_error(responses[3]) && first_text(responses[3]).find("A") != std::string::npos;
    bool deleted = !is_tool_error(responses[4]);
    bool listed_after = !is_tool_error(responses[5]) && first_text(responses[5]).find("A") == std::string::npos;

    bool success = ids_in_order && created_project && created_timeline && listed_before && deleted && listed_after &&
                   session.state() == mcp_session::State::Terminated;
    return report(success, "create project, create/list/delete/list timeline over stdio framing",
                  first_text(responses[3]) + " / " + first_text(responses[5]));
}

// Test: Non-standard exceptions from the application end the call, not the session.
static bool test_non_standard_exceptions_contained() {
    ThrowingStudio studio;
    mcp_session::Session session(studio);
    session.handle_message(initialize_request(1));
    session.handle_message(kInitializedNotification);

    studio.throw_from_open_page = true;
    json page = session.handle_message(tool_call(2, "switch_page", {{"page", "color"}}));
    studio.throw_from_open_page = false;

    studio.throw_from_project_manager = true;
    json during_refresh = session.handle_message(tool_call(3, "get_current_project_name", json::object()));
    studio.throw_from_project_manager = false;

    json after = session.handle_message(tool_call(4, "is_running", json::object()));
    bool success = page["id"] == 2 && is_tool_error(page) &&
                   first_text(page).find("unknown application error") != std::string::npos &&
                   during_refresh["id"] == 3 && during_refresh.contains("result") &&
                   !session.context().current_project && after["id"] == 4 && !is_tool_error(after) &&
                   session.state() == mcp_session::State::Initialized;
    return report(success, "non-standard exceptions become tool failures", page.dump() + during_refresh.dump());
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_requests_before_initialize();
    all_passed &= test_initialize_response();
    all_passed &= test_initialized_notification();
    all_passed &= test_notifications_never_answered();
    all_passed &= test_malformed_notification_dropped();
    all_passed &= test_protocol_errors();
    all_passed &= test_tools_after_initialize_response();
    all_passed &= test_tool_failure_is_not_rpc_error();
    all_passed &= test_terminated_session();
    all_passed &= test_context_tracks_calls();
    all_passed &= test_non_standard_exceptions_contained();
    all_passed &= test_end_to_end_scenario();
    return all_passed;
}

} // namespace test_session

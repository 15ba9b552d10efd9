#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/timeline_lookup.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_sanitize.hpp"

#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;
using handler_outcome::Outcome;
using session_context::SessionContext;

// Tool handler for "is_running".
// Reports whether the application can be reached. Not being reachable is an
// answer, not an error.
static Outcome handle_is_running(studio_api::Studio &studio, const SessionContext &context, const json &arguments) {
    (void)context;
    (void)arguments;

    if (!studio.is_running()) {
        return handler_outcome::success("Studio application is not running", false);
    }
    std::string product = utf8_sanitize::sanitize(studio.get_product_name());
    std::string version = utf8_sanitize::sanitize(studio.get_version_string());
    return handler_outcome::success(product + " " + version + " is running", true);
}

static Outcome handle_get_current_project_name(const SessionContext &context) {
    if (!context.current_project) {
        return handler_outcome::success("No project is currently open", nullptr);
    }
    std::string name = utf8_sanitize::sanitize((*context.current_project)->get_name());
    return handler_outcome::success("Current project: " + name, name);
}

// Tool handler for "list_timelines" / "list_timelines_tool".
// Without an open project the list is simply empty.
static Outcome handle_get_timelines(const SessionContext &context) {
    json names_array = json::array();
    if (!context.current_project) {
        return handler_outcome::success("No project is currently open; no timelines", names_array);
    }

    std::vector<std::string> names = timeline_lookup::list_timeline_names(**context.current_project);
    if (names.empty()) {
        return handler_outcome::success("No timelines in the current project", names_array);
    }

    std::ostringstream summary_stream;
    summary_stream << "Timelines: ";
    for (size_t index = 0; index < names.size(); index++) {
        std::string name = names[index];
        utf8_sanitize::sanitize(name);
        if (index > 0) {
            summary_stream << ", ";
        }
        summary_stream << name;
        names_array.push_back(name);
    }

    debug_log::log("get_timelines found " + std::to_string(names.size()) + " timeline(s)");
    return handler_outcome::success(summary_stream.str(), names_array);
}

static Outcome handle_get_current_timeline_name(const SessionContext &context) {
    if (!context.current_timeline) {
        return handler_outcome::success("No current timeline", nullptr);
    }
    std::string name = utf8_sanitize::sanitize((*context.current_timeline)->get_name());
    return handler_outcome::success("Current timeline: " + name, name);
}

// Tool handler for "switch_page".
// The page name goes to the application verbatim; it decides what is valid.
static Outcome handle_switch_page(studio_api::Studio &studio, const json &arguments) {
    std::string page = arguments["page"].get<std::string>();

    debug_log::log("switch_page invoked, page=" + page);
    if (!studio.open_page(page)) {
        return handler_outcome::failure("Failed to switch to page '" + page + "'");
    }
    return handler_outcome::success("Switched to " + page + " page");
}

namespace general_handlers {

void register_tools() {
    json empty_schema = mcp_tools::object_schema();

    mcp_tools::register_tool(
        "is_running",
        "Check whether the studio application is running and reachable.",
        empty_schema,
        "is_running");

    mcp_tools::register_tool(
        "get_current_project_name",
        "Get the name of the currently open project.",
        empty_schema,
        "get_current_project_name");

    mcp_tools::register_tool(
        "list_timelines",
        "List all timelines in the current project, in project order.",
        empty_schema,
        "get_timelines");

    mcp_tools::register_tool(
        "list_timelines_tool",
        "List all timelines in the current project, in project order.",
        empty_schema,
        "get_timelines");

    mcp_tools::register_tool(
        "get_current_timeline",
        "Get the name of the current timeline in the open project.",
        empty_schema,
        "get_current_timeline_name");

    json page_schema = mcp_tools::object_schema();
    mcp_tools::add_property(page_schema, "page", "string",
                            "The page to switch to: media, cut, edit, fusion, color, fairlight or deliver",
                            true);
    mcp_tools::register_tool(
        "switch_page",
        "Switch the studio application to a specific page.",
        page_schema,
        "switch_page");
}

Outcome handle(studio_api::Studio &studio,
               SessionContext context,
               const std::string &method,
               const json &arguments) {
    if (method == "is_running") {
        return handle_is_running(studio, context, arguments);
    }
    if (method == "get_current_project_name") {
        return handle_get_current_project_name(context);
    }
    if (method == "get_timelines") {
        return handle_get_timelines(context);
    }
    if (method == "get_current_timeline_name") {
        return handle_get_current_timeline_name(context);
    }
    if (method == "switch_page") {
        return handle_switch_page(studio, arguments);
    }
    return handler_outcome::failure("Unknown general method: " + method);
}

} // namespace general_handlers

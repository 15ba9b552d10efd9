#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using handler_outcome::Outcome;
using session_context::SessionContext;

namespace render_handlers {

void register_tools() {
    json empty_schema = mcp_tools::object_schema();

    json queue_schema = mcp_tools::object_schema();
    mcp_tools::add_property(queue_schema, "preset_name", "string", "Render preset to use", true);
    mcp_tools::add_property(queue_schema, "timeline_name", "string",
                            "Timeline to render (defaults to the current timeline)", false);
    mcp_tools::register_tool(
        "add_to_render_queue",
        "Add a timeline to the render queue with the given preset.",
        queue_schema,
        "render_add_to_queue");

    mcp_tools::register_tool(
        "start_render",
        "Start rendering the jobs in the render queue.",
        empty_schema,
        "render_start");

    mcp_tools::register_tool(
        "clear_render_queue",
        "Remove all jobs from the render queue.",
        empty_schema,
        "render_clear_queue");

    mcp_tools::register_tool(
        "get_render_status",
        "Report the progress of the render queue.",
        empty_schema,
        "render_get_status");
}

// Render operations are not available yet; each one fails with a fixed reason.
Outcome handle(SessionContext context, const std::string &method, const json &arguments) {
    (void)context;
    (void)arguments;

    debug_log::log("render method requested: " + method);
    return handler_outcome::failure("Render method not implemented: " + method);
}

} // namespace render_handlers

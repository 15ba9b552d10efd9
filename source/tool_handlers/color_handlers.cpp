#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using handler_outcome::Outcome;
using session_context::SessionContext;

// Color grading tools are listed so clients can discover them, but every
// call reports that the operation is not available yet.

namespace color_handlers {

void register_tools() {
    json lut_schema = mcp_tools::object_schema();
    mcp_tools::add_property(lut_schema, "lut_path", "string", "Path to the LUT file", true);
    mcp_tools::add_property_with_default(lut_schema, "node_index", "integer", "Node to apply the LUT to", 1);
    mcp_tools::register_tool(
        "apply_lut",
        "Apply a LUT to a node of the current clip's grade.",
        lut_schema,
        "color_apply_lut");

    json node_schema = mcp_tools::object_schema();
    mcp_tools::add_property_with_default(node_schema, "node_type", "string",
                                         "Node type: serial, parallel or layer", "serial");
    mcp_tools::add_property(node_schema, "label", "string", "Optional node label", false);
    mcp_tools::register_tool(
        "add_node",
        "Add a node to the current clip's grade.",
        node_schema,
        "color_add_node");

    json copy_schema = mcp_tools::object_schema();
    mcp_tools::add_property(copy_schema, "source_clip_name", "string", "Clip to copy the grade from", true);
    mcp_tools::add_property(copy_schema, "target_clip_name", "string", "Clip to copy the grade to", true);
    mcp_tools::register_tool(
        "copy_grade",
        "Copy a grade from one clip to another.",
        copy_schema,
        "color_copy_grade");

    json wheel_schema = mcp_tools::object_schema();
    mcp_tools::add_property(wheel_schema, "wheel", "string", "Wheel: lift, gamma, gain or offset", true);
    mcp_tools::add_property(wheel_schema, "param", "string", "Parameter: red, green, blue or master", true);
    mcp_tools::add_property(wheel_schema, "value", "number", "New parameter value", true);
    mcp_tools::register_tool(
        "set_color_wheel_param",
        "Set a color wheel parameter on the current node.",
        wheel_schema,
        "color_set_wheel_param");
}

Outcome handle(SessionContext context, const std::string &method, const json &arguments) {
    (void)context;
    (void)arguments;

    debug_log::log("color method requested: " + method);
    return handler_outcome::failure("Color method not implemented: " + method);
}

} // namespace color_handlers

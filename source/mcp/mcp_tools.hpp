#ifndef EDMCPS_MCP_TOOLS_HPP
#define EDMCPS_MCP_TOOLS_HPP

// MCP tool catalog: registration, listing, lookup and argument validation.
// Entries are registered once at startup and read-only afterwards.

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "router/tool_category.hpp"

namespace mcp_tools {

using json = nlohmann::json;

// One catalog entry, matching the MCP tool schema plus the routing data.
struct ToolDefinition {
    std::string name;
    std::string description;
    json input_schema;             // JSON Schema object
    std::string method;            // handler method identifier, e.g. "timeline_create"
    tool_router::Category category = tool_router::Category::General;  // derived from method
};

// Register a tool. The category is derived from method here.
// Returns false (and registers nothing) if the name is taken or the method
// belongs to no handler group.
bool register_tool(const std::string &name,
                   const std::string &description,
                   const json &input_schema,
                   const std::string &method);

// Build the response payload for tools/list.
json build_tools_list_response();

// Look up a tool by name.
std::optional<ToolDefinition> find_tool(const std::string &tool_name);

// Checks arguments against the tool's input schema: required properties
// present, declared types respected. Returns an empty string when valid,
// otherwise a message naming the offending argument.
std::string validate_arguments(const ToolDefinition &definition, const json &arguments);

// Returns a copy of arguments with schema "default" values filled in for
// absent optional properties.
json apply_defaults(const ToolDefinition &definition, const json &arguments);

// Get all registered tool definitions (for testing or introspection).
const std::vector<ToolDefinition> &get_registered_tools();

// --- Schema construction helpers used by the tool_handlers ---

json object_schema();
void add_property(json &schema, const std::string &property_name, const std::string &type,
                  const std::string &description, bool required);
void add_property_with_default(json &schema, const std::string &property_name, const std::string &type,
                               const std::string &description, const json &default_value);

} // namespace mcp_tools

#endif // EDMCPS_MCP_TOOLS_HPP

#include "mcp/mcp_tools.hpp"

#include "utils/debug_log.hpp"

#include <cstdint>
#include <limits>

namespace mcp_tools {

// Global tool registry (module-level, not class-based).
static std::vector<ToolDefinition> registered_tools;

bool register_tool(const std::string &name,
                   const std::string &description,
                   const json &input_schema,
                   const std::string &method) {
    std::optional<tool_router::Category> category = tool_router::category_for_method(method);
    if (!category) {
        debug_log::error("Tool '" + name + "' not registered: method '" + method +
                         "' belongs to no handler group");
        return false;
    }
    for (const auto &tool : registered_tools) {
        if (tool.name == name) {
            debug_log::log("Tool '" + name + "' already registered, skipping");
            return false;
        }
    }

    ToolDefinition definition;
    definition.name = name;
    definition.description = description;
    definition.input_schema = input_schema;
    definition.method = method;
    definition.category = *category;
    registered_tools.push_back(definition);
    return true;
}

json build_tools_list_response() {
    json tools_array = json::array();
    for (const auto &tool : registered_tools) {
        json tool_entry;
        tool_entry["name"] = tool.name;
        tool_entry["description"] = tool.description;
        tool_entry["inputSchema"] = tool.input_schema;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

std::optional<ToolDefinition> find_tool(const std::string &tool_name) {
    for (const auto &tool : registered_tools) {
        if (tool.name == tool_name) {
            return tool;
        }
    }
    return std::nullopt;
}

static bool matches_type(const json &value, const std::string &type) {
    if (type == "string") {
        return value.is_string();
    }
    if (type == "integer") {
        return value.is_number_integer();
    }
    if (type == "number") {
        return value.is_number();
    }
    if (type == "boolean") {
        return value.is_boolean();
    }
    if (type == "array") {
        return value.is_array();
    }
    if (type == "object") {
        return value.is_object();
    }
    // Unknown or absent type: anything goes.
    return true;
}

// Handlers read integer arguments as int.
static bool fits_int(const json &value) {
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    }
    std::int64_t number = value.get<std::int64_t>();
    return number >= std::numeric_limits<int>::min() && number <= std::numeric_limits<int>::max();
}

std::string validate_arguments(const ToolDefinition &definition, const json &arguments) {
    if (!arguments.is_object()) {
        return definition.name + " requires an arguments object";
    }

    const json &schema = definition.input_schema;

    if (schema.contains("required") && schema["required"].is_array()) {
        for (const auto &required_name : schema["required"]) {
            if (!required_name.is_string()) {
                continue;
            }
            std::string property_name = required_name.get<std::string>();
            if (!arguments.contains(property_name) || arguments[property_name].is_null()) {
                return definition.name + " requires argument '" + property_name + "'";
            }
        }
    }

    if (!schema.contains("properties") || !schema["properties"].is_object()) {
        return "";
    }

    for (auto property = schema["properties"].begin(); property != schema["properties"].end(); ++property) {
        const std::string &property_name = property.key();
        if (!arguments.contains(property_name) || arguments[property_name].is_null()) {
            continue;
        }
        if (!property.value().contains("type") || !property.value()["type"].is_string()) {
            continue;
        }
        std::string type = property.value()["type"].get<std::string>();
        if (!matches_type(arguments[property_name], type)) {
            return definition.name + " argument '" + property_name + "' must be of type " + type;
        }
        if (type == "integer" && !fits_int(arguments[property_name])) {
            return definition.name + " argument '" + property_name + "' is out of range";
        }
    }

    return "";
}

json apply_defaults(const ToolDefinition &definition, const json &arguments) {
    json completed = arguments.is_object() ? arguments : json::object();

    const json &schema = definition.input_schema;
    if (!schema.contains("properties") || !schema["properties"].is_object()) {
        return completed;
    }

    for (auto property = schema["properties"].begin(); property != schema["properties"].end(); ++property) {
        if (!property.value().contains("default")) {
            continue;
        }
        const std::string &property_name = property.key();
        if (!completed.contains(property_name) || completed[property_name].is_null()) {
            completed[property_name] = property.value()["default"];
        }
    }
    return completed;
}

const std::vector<ToolDefinition> &get_registered_tools() {
    return registered_tools;
}

json object_schema() {
    json schema;
    schema["type"] = "object";
    schema["properties"] = json::object();
    return schema;
}

void add_property(json &schema, const std::string &property_name, const std::string &type,
                  const std::string &description, bool required) {
    schema["properties"][property_name] = {
        {"type", type},
        {"description", description}
    };
    if (required) {
        if (!schema.contains("required")) {
            schema["required"] = json::array();
        }
        schema["required"].push_back(property_name);
    }
}

void add_property_with_default(json &schema, const std::string &property_name, const std::string &type,
                               const std::string &description, const json &default_value) {
    add_property(schema, property_name, type, description, false);
    schema["properties"][property_name]["default"] = default_value;
}

} // namespace mcp_tools

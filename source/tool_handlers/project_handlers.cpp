#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_sanitize.hpp"

#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;
using handler_outcome::Outcome;
using session_context::SessionContext;

static const char kNotRunningMessage[] = "Studio application is not running (no project manager available)";

// Project handlers go through the project manager rather than the context,
// since creating or opening a project is what establishes a context.
static std::optional<studio_api::ProjectManagerHandle> project_manager_of(studio_api::Studio &studio) {
    std::optional<studio_api::ProjectManagerHandle> manager = studio.get_project_manager();
    if (manager && !*manager) {
        return std::nullopt;
    }
    return manager;
}

// Tool handler for "create_project".
// The new project becomes current right away, ahead of the next refresh.
static Outcome handle_project_create(studio_api::Studio &studio, const json &arguments) {
    std::string name = arguments["name"].get<std::string>();

    std::optional<studio_api::ProjectManagerHandle> manager = project_manager_of(studio);
    if (!manager) {
        return handler_outcome::failure(kNotRunningMessage);
    }

    debug_log::log("project_create invoked, name=" + name);
    std::optional<studio_api::ProjectHandle> project = (*manager)->create_project(name);
    if (!project || !*project) {
        return handler_outcome::failure("Failed to create project '" + name +
                                        "' (a project with that name may already exist)");
    }

    Outcome outcome = handler_outcome::success("Created project '" + name + "'");
    outcome.updated_context = session_context::context_for_project(*project);
    return outcome;
}

// Tool handler for "open_project".
static Outcome handle_project_open(studio_api::Studio &studio, const json &arguments) {
    std::string name = arguments["name"].get<std::string>();

    std::optional<studio_api::ProjectManagerHandle> manager = project_manager_of(studio);
    if (!manager) {
        return handler_outcome::failure(kNotRunningMessage);
    }

    debug_log::log("project_open invoked, name=" + name);
    std::optional<studio_api::ProjectHandle> project = (*manager)->load_project(name);
    if (!project || !*project) {
        return handler_outcome::failure("Failed to open project '" + name + "'");
    }

    Outcome outcome = handler_outcome::success("Opened project '" + name + "'");
    outcome.updated_context = session_context::context_for_project(*project);
    return outcome;
}

static Outcome handle_project_save(studio_api::Studio &studio, const SessionContext &context) {
    std::optional<studio_api::ProjectManagerHandle> manager = project_manager_of(studio);
    if (!manager) {
        return handler_outcome::failure(kNotRunningMessage);
    }
    if (!context.current_project) {
        return handler_outcome::failure("No project is currently open");
    }

    std::string name = utf8_sanitize::sanitize((*context.current_project)->get_name());
    if (!(*manager)->save_project()) {
        return handler_outcome::failure("Failed to save project '" + name + "'");
    }
    return handler_outcome::success("Saved project '" + name + "'");
}

// Tool handler for "close_project".
// On success all three context fields become absent.
static Outcome handle_project_close(studio_api::Studio &studio, const SessionContext &context) {
    std::optional<studio_api::ProjectManagerHandle> manager = project_manager_of(studio);
    if (!manager) {
        return handler_outcome::failure(kNotRunningMessage);
    }
    if (!context.current_project) {
        return handler_outcome::failure("No project is currently open");
    }

    const studio_api::ProjectHandle &project = *context.current_project;
    std::string name = utf8_sanitize::sanitize(project->get_name());
    if (!(*manager)->close_project(project)) {
        return handler_outcome::failure("Failed to close project '" + name + "'");
    }

    Outcome outcome = handler_outcome::success("Closed project '" + name + "'");
    outcome.updated_context = SessionContext();
    return outcome;
}

static Outcome handle_project_list(studio_api::Studio &studio) {
    std::optional<studio_api::ProjectManagerHandle> manager = project_manager_of(studio);
    if (!manager) {
        return handler_outcome::failure(kNotRunningMessage);
    }

    std::vector<std::string> names = (*manager)->list_projects();
    json names_array = json::array();
    if (names.empty()) {
        return handler_outcome::success("No projects in the current folder", names_array);
    }

    std::ostringstream summary_stream;
    summary_stream << "Projects: ";
    for (size_t index = 0; index < names.size(); index++) {
        std::string name = names[index];
        utf8_sanitize::sanitize(name);
        if (index > 0) {
            summary_stream << ", ";
        }
        summary_stream << name;
        names_array.push_back(name);
    }
    return handler_outcome::success(summary_stream.str(), names_array);
}

// Tool handler for "set_project_setting".
// Non-string values are passed as their JSON text ("25", "true").
static Outcome handle_project_set_setting(const SessionContext &context, const json &arguments) {
    if (!context.current_project) {
        return handler_outcome::failure("No project is currently open");
    }

    std::string setting_name = arguments["setting_name"].get<std::string>();
    const json &setting_value = arguments["setting_value"];
    std::string value_text = setting_value.is_string() ? setting_value.get<std::string>() : setting_value.dump();

    debug_log::log("project_set_setting invoked, " + setting_name + "=" + value_text);
    if (!(*context.current_project)->set_setting(setting_name, value_text)) {
        return handler_outcome::failure("Failed to set project setting '" + setting_name + "' to '" +
                                        value_text + "'");
    }
    return handler_outcome::success("Set project setting '" + setting_name + "' to '" + value_text + "'");
}

namespace project_handlers {

void register_tools() {
    json empty_schema = mcp_tools::object_schema();

    json create_schema = mcp_tools::object_schema();
    mcp_tools::add_property(create_schema, "name", "string", "Name for the new project", true);
    mcp_tools::register_tool(
        "create_project",
        "Create a new project with the given name. The new project becomes the current project.",
        create_schema,
        "project_create");

    json open_schema = mcp_tools::object_schema();
    mcp_tools::add_property(open_schema, "name", "string", "Name of the project to open", true);
    mcp_tools::register_tool(
        "open_project",
        "Open an existing project by name. The opened project becomes the current project.",
        open_schema,
        "project_open");

    mcp_tools::register_tool(
        "save_project",
        "Save the current project.",
        empty_schema,
        "project_save");

    mcp_tools::register_tool(
        "close_project",
        "Close the current project.",
        empty_schema,
        "project_close");

    mcp_tools::register_tool(
        "list_projects",
        "List the projects in the project manager's current folder.",
        empty_schema,
        "project_list");

    json setting_schema = mcp_tools::object_schema();
    mcp_tools::add_property(setting_schema, "setting_name", "string", "The name of the setting to change", true);
    setting_schema["properties"]["setting_value"] = {
        {"description", "The new value for the setting (string, integer, float or boolean)"}
    };
    setting_schema["required"].push_back("setting_value");
    mcp_tools::register_tool(
        "set_project_setting",
        "Set a project setting to the specified value.",
        setting_schema,
        "project_set_setting");
}

Outcome handle(studio_api::Studio &studio,
               SessionContext context,
               const std::string &method,
               const json &arguments) {
    if (method == "project_create") {
        return handle_project_create(studio, arguments);
    }
    if (method == "project_open") {
        return handle_project_open(studio, arguments);
    }
    if (method == "project_save") {
        return handle_project_save(studio, context);
    }
    if (method == "project_close") {
        return handle_project_close(studio, context);
    }
    if (method == "project_list") {
        return handle_project_list(studio);
    }
    if (method == "project_set_setting") {
        return handle_project_set_setting(context, arguments);
    }
    return handler_outcome::failure("Unknown project method: " + method);
}

} // namespace project_handlers

#include "router/tool_router.hpp"

#include <exception>
#include <string>

#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

namespace tool_router {

// Prefix-routed groups. No prefix is a prefix of another.
struct PrefixRule {
    const char *prefix;
    Category category;
};

static const PrefixRule kPrefixRules[] = {
    {"project_", Category::Project},
    {"timeline_", Category::Timeline},
    {"media_", Category::Media},
    {"color_", Category::Color},
    {"render_", Category::Render},
};

static const char *const kGeneralMethods[] = {
    "is_running",
    "get_current_project_name",
    "get_timelines",
    "get_current_timeline_name",
    "switch_page",
};

std::optional<Category> category_for_method(const std::string &method) {
    for (const char *general_method : kGeneralMethods) {
        if (method == general_method) {
            return Category::General;
        }
    }
    for (const auto &rule : kPrefixRules) {
        std::string prefix(rule.prefix);
        if (method.size() > prefix.size() && method.compare(0, prefix.size(), prefix) == 0) {
            return rule.category;
        }
    }
    return std::nullopt;
}

const char *category_name(Category category) {
    switch (category) {
    case Category::General:
        return "general";
    case Category::Project:
        return "project";
    case Category::Timeline:
        return "timeline";
    case Category::Media:
        return "media";
    case Category::Color:
        return "color";
    case Category::Render:
        return "render";
    }
    return "general";
}

static handler_outcome::Outcome dispatch_to_group(studio_api::Studio &studio,
                                                  const session_context::SessionContext &context,
                                                  const mcp_tools::ToolDefinition &tool,
                                                  const json &arguments) {
    switch (tool.category) {
    case Category::General:
        return general_handlers::handle(studio, context, tool.method, arguments);
    case Category::Project:
        return project_handlers::handle(studio, context, tool.method, arguments);
    case Category::Timeline:
        return timeline_handlers::handle(context, tool.method, arguments);
    case Category::Media:
        return media_handlers::handle(context, tool.method, arguments);
    case Category::Color:
        return color_handlers::handle(context, tool.method, arguments);
    case Category::Render:
        return render_handlers::handle(context, tool.method, arguments);
    }
    return handler_outcome::failure("Method not found: " + tool.method);
}

handler_outcome::Outcome route_call(studio_api::Studio &studio,
                                    session_context::RefreshedContext refreshed,
                                    const mcp_tools::ToolDefinition &tool,
                                    const json &arguments) {
    std::string validation_error = mcp_tools::validate_arguments(tool, arguments);
    if (!validation_error.empty()) {
        debug_log::log("tools/call " + tool.name + " rejected: " + validation_error);
        return handler_outcome::failure(validation_error);
    }
    json completed_arguments = mcp_tools::apply_defaults(tool, arguments);

    const session_context::SessionContext &context = refreshed.context();

    // Timeline and media handlers all operate inside the open project.
    if ((tool.category == Category::Timeline || tool.category == Category::Media) &&
        !context.current_project) {
        return handler_outcome::failure(tool.name + " failed: no project is currently open");
    }

    debug_log::log("tools/call " + tool.name + " -> " + category_name(tool.category) + "/" + tool.method);
    try {
        return dispatch_to_group(studio, context, tool, completed_arguments);
    } catch (const std::exception &error) {
        debug_log::warn("tools/call " + tool.name + " raised: " + error.what());
        return handler_outcome::failure(tool.name + " failed: " + error.what());
    } catch (...) {
        debug_log::warn("tools/call " + tool.name + " raised a non-standard exception");
        return handler_outcome::failure(tool.name + " failed: unknown application error");
    }
}

} // namespace tool_router

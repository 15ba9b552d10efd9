#ifndef EDMCPS_TOOL_CATEGORY_HPP
#define EDMCPS_TOOL_CATEGORY_HPP

// Handler groups a method identifier can belong to.
// The tag is derived once, when a tool is registered, and dispatch switches
// on it afterwards.

#include <optional>
#include <string>

namespace tool_router {

enum class Category {
    General,
    Project,
    Timeline,
    Media,
    Color,
    Render
};

// Exact general names first (is_running, get_current_project_name,
// get_timelines, get_current_timeline_name, switch_page), then the prefixes
// project_, timeline_, media_, color_, render_. A method matches at most one
// group. Returns nullopt when nothing matches.
std::optional<Category> category_for_method(const std::string &method);

const char *category_name(Category category);

} // namespace tool_router

#endif // EDMCPS_TOOL_CATEGORY_HPP

#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/timeline_lookup.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"
#include "utils/server_config.hpp"
#include "utils/utf8_sanitize.hpp"

#include <nlohmann/json.hpp>
#include <sstream>
#include <vector>

using json = nlohmann::json;
using handler_outcome::Outcome;
using session_context::SessionContext;

// Tool handler for "create_timeline" / "create_empty_timeline".
// Needs the media pool. The new timeline does not become current.
// Frame rate and resolution arrive filled in from the schema defaults when
// the caller leaves them out; the color space always comes from the config.
static Outcome handle_timeline_create(const SessionContext &context, const json &arguments) {
    std::string name = arguments["name"].get<std::string>();

    for (const char *dimension : {"resolution_width", "resolution_height"}) {
        if (arguments.contains(dimension) && arguments[dimension].is_number_integer() &&
            arguments[dimension].get<int>() <= 0) {
            return handler_outcome::failure("Failed to create timeline '" + name + "': " + dimension +
                                            " must be positive");
        }
    }

    if (!context.current_media_pool) {
        return handler_outcome::failure("Failed to create timeline '" + name + "': no media pool available");
    }

    debug_log::log("timeline_create invoked, name=" + name);
    std::optional<studio_api::TimelineHandle> timeline = (*context.current_media_pool)->create_empty_timeline(name);
    if (!timeline || !*timeline) {
        return handler_outcome::failure("Failed to create timeline '" + name + "'");
    }

    std::vector<std::pair<std::string, std::string>> settings;
    if (arguments.contains("frame_rate") && arguments["frame_rate"].is_string()) {
        settings.emplace_back("timelineFrameRate", arguments["frame_rate"].get<std::string>());
    }
    if (arguments.contains("resolution_width") && arguments["resolution_width"].is_number_integer()) {
        settings.emplace_back("timelineResolutionWidth", std::to_string(arguments["resolution_width"].get<int>()));
    }
    if (arguments.contains("resolution_height") && arguments["resolution_height"].is_number_integer()) {
        settings.emplace_back("timelineResolutionHeight", std::to_string(arguments["resolution_height"].get<int>()));
    }
    const std::string &color_space = server_config::current().default_project.color_space;
    if (!color_space.empty()) {
        settings.emplace_back("colorSpaceTimeline", color_space);
    }

    std::vector<std::string> rejected_settings;
    if (!settings.empty() && !(*timeline)->set_setting("useCustomSettings", "1")) {
        rejected_settings.push_back("useCustomSettings");
    }
    json applied_settings = json::object();
    for (const auto &setting : settings) {
        if ((*timeline)->set_setting(setting.first, setting.second)) {
            applied_settings[setting.first] = setting.second;
        } else {
            rejected_settings.push_back(setting.first);
        }
    }

    std::ostringstream message_stream;
    message_stream << "Created timeline '" << name << "'";
    if (!rejected_settings.empty()) {
        message_stream << " (settings not applied:";
        for (const auto &setting_name : rejected_settings) {
            message_stream << " " << setting_name;
        }
        message_stream << ")";
    }

    json value;
    value["name"] = name;
    value["settings"] = applied_settings;
    return handler_outcome::success(message_stream.str(), value);
}

// Tool handler for "delete_timeline".
// The first timeline (lowest index) with the exact name is deleted; others
// with the same name are left alone.
static Outcome handle_timeline_delete(const SessionContext &context, const json &arguments) {
    std::string name = arguments["name"].get<std::string>();

    if (!context.current_project) {
        return handler_outcome::failure("No project is currently open");
    }

    studio_api::Project &project = **context.current_project;
    std::optional<studio_api::TimelineHandle> timeline = timeline_lookup::find_timeline_by_name(project, name);
    if (!timeline) {
        return handler_outcome::failure("Timeline '" + name + "' not found");
    }

    debug_log::log("timeline_delete invoked, name=" + name);
    if (!project.delete_timelines({*timeline})) {
        return handler_outcome::failure("Failed to delete timeline '" + name + "'");
    }
    return handler_outcome::success("Deleted timeline '" + name + "'");
}

// Tool handler for "set_current_timeline".
// current_timeline moves only when the application confirms the switch.
static Outcome handle_timeline_set_current(const SessionContext &context, const json &arguments) {
    std::string name = arguments["name"].get<std::string>();

    if (!context.current_project) {
        return handler_outcome::failure("No project is currently open");
    }

    studio_api::Project &project = **context.current_project;
    std::optional<studio_api::TimelineHandle> timeline = timeline_lookup::find_timeline_by_name(project, name);
    if (!timeline) {
        return handler_outcome::failure("Timeline '" + name + "' not found");
    }

    debug_log::log("timeline_set_current invoked, name=" + name);
    if (!project.set_current_timeline(*timeline)) {
        return handler_outcome::failure("Failed to set current timeline to '" + name + "'");
    }

    Outcome outcome = handler_outcome::success("Set current timeline to '" + name + "'");
    SessionContext updated = context;
    updated.current_timeline = timeline;
    outcome.updated_context = updated;
    return outcome;
}

// Tool handler for "add_marker". Works on the current timeline.
static Outcome handle_timeline_add_marker(const SessionContext &context, const json &arguments) {
    if (!context.current_timeline) {
        return handler_outcome::failure("No current timeline; call set_current_timeline first");
    }

    studio_api::MarkerSpec marker;
    marker.frame = arguments["frame"].get<int>();
    marker.color = arguments["color"].get<std::string>();
    marker.note = arguments["note"].get<std::string>();
    marker.name = arguments["name"].get<std::string>();
    marker.duration = arguments["duration"].get<int>();

    studio_api::Timeline &timeline = **context.current_timeline;
    std::string timeline_name = utf8_sanitize::sanitize(timeline.get_name());

    debug_log::log("timeline_add_marker invoked, frame=" + std::to_string(marker.frame));
    if (!timeline.add_marker(marker)) {
        return handler_outcome::failure("Failed to add marker at frame " + std::to_string(marker.frame) +
                                        " to timeline '" + timeline_name +
                                        "' (a marker may already exist there)");
    }
    return handler_outcome::success("Added " + marker.color + " marker at frame " +
                                    std::to_string(marker.frame) + " to timeline '" + timeline_name + "'");
}

// Tool handler for "get_timeline_tracks".
static Outcome handle_timeline_get_tracks(const SessionContext &context, const json &arguments) {
    if (!context.current_project) {
        return handler_outcome::failure("No project is currently open");
    }

    std::optional<studio_api::TimelineHandle> timeline;
    if (arguments.contains("timeline_name") && arguments["timeline_name"].is_string()) {
        std::string timeline_name = arguments["timeline_name"].get<std::string>();
        timeline = timeline_lookup::find_timeline_by_name(**context.current_project, timeline_name);
        if (!timeline) {
            return handler_outcome::failure("Timeline '" + timeline_name + "' not found");
        }
    } else {
        timeline = context.current_timeline;
        if (!timeline) {
            return handler_outcome::failure("No current timeline; pass timeline_name or call set_current_timeline first");
        }
    }

    studio_api::Timeline &target = **timeline;
    json tracks;
    tracks["timeline"] = utf8_sanitize::sanitize(target.get_name());
    const studio_api::TrackType track_types[] = {
        studio_api::TrackType::Video, studio_api::TrackType::Audio, studio_api::TrackType::Subtitle
    };
    for (studio_api::TrackType type : track_types) {
        tracks[studio_api::track_type_name(type)] = target.get_track_count(type);
    }

    std::ostringstream summary_stream;
    summary_stream << "Timeline '" << tracks["timeline"].get<std::string>() << "' has "
                   << tracks["video"].get<int>() << " video, "
                   << tracks["audio"].get<int>() << " audio and "
                   << tracks["subtitle"].get<int>() << " subtitle track(s)";
    return handler_outcome::success(summary_stream.str(), tracks);
}

static void register_create_tool(const std::string &tool_name, const std::string &description) {
    const server_config::DefaultProjectSettings &defaults = server_config::current().default_project;

    json schema = mcp_tools::object_schema();
    mcp_tools::add_property(schema, "name", "string", "Name for the new timeline", true);
    mcp_tools::add_property_with_default(schema, "frame_rate", "string",
                                         "Frame rate (e.g. '24', '29.97', '30', '60')", defaults.frame_rate);
    mcp_tools::add_property_with_default(schema, "resolution_width", "integer",
                                         "Width in pixels (e.g. 1920)", defaults.width);
    mcp_tools::add_property_with_default(schema, "resolution_height", "integer",
                                         "Height in pixels (e.g. 1080)", defaults.height);
    mcp_tools::register_tool(tool_name, description, schema, "timeline_create");
}

namespace timeline_handlers {

void register_tools() {
    register_create_tool(
        "create_timeline",
        "Create a new timeline with the given name in the current project's media pool. "
        "The new timeline does not become the current timeline.");
    register_create_tool(
        "create_empty_timeline",
        "Create a new empty timeline with custom frame rate and resolution. "
        "The new timeline does not become the current timeline.");

    json delete_schema = mcp_tools::object_schema();
    mcp_tools::add_property(delete_schema, "name", "string", "Name of the timeline to delete", true);
    mcp_tools::register_tool(
        "delete_timeline",
        "Delete a timeline by name. If several timelines share the name, the first one "
        "in project order is deleted.",
        delete_schema,
        "timeline_delete");

    json set_current_schema = mcp_tools::object_schema();
    mcp_tools::add_property(set_current_schema, "name", "string", "Name of the timeline to make current", true);
    mcp_tools::register_tool(
        "set_current_timeline",
        "Switch the current timeline by name.",
        set_current_schema,
        "timeline_set_current");

    json marker_schema = mcp_tools::object_schema();
    mcp_tools::add_property_with_default(marker_schema, "frame", "integer", "Frame to place the marker at", 0);
    mcp_tools::add_property_with_default(marker_schema, "color", "string",
                                         "Marker color (Blue, Cyan, Green, Yellow, Red, Pink, Purple, ...)", "Blue");
    mcp_tools::add_property_with_default(marker_schema, "note", "string", "Text note for the marker", "");
    mcp_tools::add_property_with_default(marker_schema, "name", "string", "Marker name", "");
    mcp_tools::add_property_with_default(marker_schema, "duration", "integer", "Marker duration in frames", 1);
    mcp_tools::register_tool(
        "add_marker",
        "Add a marker at the specified frame in the current timeline.",
        marker_schema,
        "timeline_add_marker");

    json tracks_schema = mcp_tools::object_schema();
    mcp_tools::add_property(tracks_schema, "timeline_name", "string",
                            "Timeline to inspect (defaults to the current timeline)", false);
    mcp_tools::register_tool(
        "get_timeline_tracks",
        "Get the number of video, audio and subtitle tracks of a timeline.",
        tracks_schema,
        "timeline_get_tracks");
}

Outcome handle(SessionContext context, const std::string &method, const json &arguments) {
    if (method == "timeline_create") {
        return handle_timeline_create(context, arguments);
    }
    if (method == "timeline_delete") {
        return handle_timeline_delete(context, arguments);
    }
    if (method == "timeline_set_current") {
        return handle_timeline_set_current(context, arguments);
    }
    if (method == "timeline_add_marker") {
        return handle_timeline_add_marker(context, arguments);
    }
    if (method == "timeline_get_tracks") {
        return handle_timeline_get_tracks(context, arguments);
    }
    return handler_outcome::failure("Unknown timeline method: " + method);
}

} // namespace timeline_handlers

#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_sanitize.hpp"

#include <nlohmann/json.hpp>
#include <vector>

using json = nlohmann::json;
using handler_outcome::Outcome;
using session_context::SessionContext;

// Tool handler for "import_media".
// One path per call; the application answering with no usable clip is a failure.
static Outcome handle_media_import(const SessionContext &context, const json &arguments) {
    std::string file_path = arguments["file_path"].get<std::string>();

    if (!context.current_media_pool) {
        return handler_outcome::failure("Failed to import media: no media pool available");
    }

    debug_log::log("media_import invoked, file_path=" + file_path);
    std::vector<studio_api::MediaPoolItemHandle> imported =
        (*context.current_media_pool)->import_media({file_path});
    json clips = json::array();
    for (const auto &clip : imported) {
        if (clip) {
            json clip_entry;
            clip_entry["name"] = utf8_sanitize::sanitize(clip->get_name());
            clip_entry["file_path"] = utf8_sanitize::sanitize(clip->get_file_path());
            clips.push_back(clip_entry);
        }
    }
    if (clips.empty()) {
        return handler_outcome::failure("Failed to import media: " + file_path);
    }
    return handler_outcome::success("Imported media: " + file_path, clips);
}

// Tool handler for "create_bin". Bin names are not deduplicated.
static Outcome handle_media_create_bin(const SessionContext &context, const json &arguments) {
    std::string name = arguments["name"].get<std::string>();

    if (!context.current_media_pool) {
        return handler_outcome::failure("Failed to create bin '" + name + "': no media pool available");
    }

    debug_log::log("media_create_bin invoked, name=" + name);
    std::optional<studio_api::BinHandle> bin = (*context.current_media_pool)->create_bin(name);
    if (!bin || !*bin) {
        return handler_outcome::failure("Failed to create bin '" + name + "'");
    }
    return handler_outcome::success("Created bin '" + name + "'");
}

// Tool handler for "add_clip_to_timeline".
// Clips are always appended to the current timeline; naming a different
// timeline is refused.
static Outcome handle_media_append_to_timeline(const SessionContext &context, const json &arguments) {
    std::string clip_name = arguments["clip_name"].get<std::string>();

    if (!context.current_media_pool) {
        return handler_outcome::failure("Failed to add clip '" + clip_name + "': no media pool available");
    }
    if (!context.current_timeline) {
        return handler_outcome::failure("Failed to add clip '" + clip_name +
                                        "': no current timeline; call set_current_timeline first");
    }

    std::string timeline_name = utf8_sanitize::sanitize((*context.current_timeline)->get_name());
    if (arguments.contains("timeline_name") && arguments["timeline_name"].is_string()) {
        std::string requested = arguments["timeline_name"].get<std::string>();
        if (requested != timeline_name) {
            return handler_outcome::failure("Timeline '" + requested + "' is not the current timeline ('" +
                                            timeline_name + "'); call set_current_timeline first");
        }
    }

    studio_api::MediaPool &media_pool = **context.current_media_pool;
    std::optional<studio_api::MediaPoolItemHandle> clip = media_pool.find_clip(clip_name);
    if (!clip) {
        return handler_outcome::failure("Clip '" + clip_name + "' not found in the media pool");
    }

    debug_log::log("media_append_to_timeline invoked, clip=" + clip_name + " timeline=" + timeline_name);
    if (!media_pool.append_to_timeline({*clip})) {
        return handler_outcome::failure("Failed to add clip '" + clip_name + "' to timeline '" + timeline_name + "'");
    }
    return handler_outcome::success("Added clip '" + clip_name + "' to timeline '" + timeline_name + "'");
}

namespace media_handlers {

void register_tools() {
    json import_schema = mcp_tools::object_schema();
    mcp_tools::add_property(import_schema, "file_path", "string", "Path to the media file to import", true);
    mcp_tools::register_tool(
        "import_media",
        "Import a media file into the current project's media pool.",
        import_schema,
        "media_import");

    json bin_schema = mcp_tools::object_schema();
    mcp_tools::add_property(bin_schema, "name", "string", "Name for the new bin", true);
    mcp_tools::register_tool(
        "create_bin",
        "Create a new bin (folder) in the media pool.",
        bin_schema,
        "media_create_bin");

    json append_schema = mcp_tools::object_schema();
    mcp_tools::add_property(append_schema, "clip_name", "string", "Name of the media pool clip to add", true);
    mcp_tools::add_property(append_schema, "timeline_name", "string",
                            "Target timeline; must be the current timeline when given", false);
    mcp_tools::register_tool(
        "add_clip_to_timeline",
        "Append a media pool clip to the end of the current timeline.",
        append_schema,
        "media_append_to_timeline");
}

Outcome handle(SessionContext context, const std::string &method, const json &arguments) {
    if (method == "media_import") {
        return handle_media_import(context, arguments);
    }
    if (method == "media_create_bin") {
        return handle_media_create_bin(context, arguments);
    }
    if (method == "media_append_to_timeline") {
        return handle_media_append_to_timeline(context, arguments);
    }
    return handler_outcome::failure("Unknown media method: " + method);
}

} // namespace media_handlers

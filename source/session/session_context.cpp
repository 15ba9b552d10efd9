#include "session/session_context.hpp"

#include <exception>
#include <string>

#include "utils/debug_log.hpp"

namespace session_context {

// Runs one accessor, mapping exceptions and null handles to "absent".
template <typename Accessor>
static auto fetch_or_absent(const char *what, Accessor accessor) -> decltype(accessor()) {
    try {
        auto handle = accessor();
        if (handle && !*handle) {
            return std::nullopt;
        }
        return handle;
    } catch (const std::exception &error) {
        debug_log::log(std::string("refresh: ") + what + " unavailable: " + error.what());
    } catch (...) {
        debug_log::log(std::string("refresh: ") + what + " unavailable: unknown application error");
    }
    return std::nullopt;
}

RefreshedContext refresh_context(studio_api::Studio &studio) {
    SessionContext context;

    std::optional<studio_api::ProjectManagerHandle> manager =
        fetch_or_absent("project manager", [&studio]() { return studio.get_project_manager(); });
    if (!manager) {
        debug_log::log("refresh: application unreachable, context cleared");
        return RefreshedContext(context);
    }

    context.current_project =
        fetch_or_absent("current project", [&manager]() { return (*manager)->get_current_project(); });
    if (!context.current_project) {
        debug_log::log("refresh: no project open, context cleared");
        return RefreshedContext(context);
    }

    const studio_api::ProjectHandle &project = *context.current_project;
    context.current_media_pool =
        fetch_or_absent("media pool", [&project]() { return project->get_media_pool(); });
    context.current_timeline =
        fetch_or_absent("current timeline", [&project]() { return project->get_current_timeline(); });

    return RefreshedContext(context);
}

SessionContext context_for_project(const studio_api::ProjectHandle &project) {
    SessionContext context;
    if (!project) {
        return context;
    }
    context.current_project = project;
    context.current_media_pool =
        fetch_or_absent("media pool", [&project]() { return project->get_media_pool(); });
    return context;
}

bool is_consistent(const SessionContext &context) {
    if (context.current_project) {
        return true;
    }
    return !context.current_media_pool && !context.current_timeline;
}

} // namespace session_context

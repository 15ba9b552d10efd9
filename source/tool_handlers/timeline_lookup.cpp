#include "tool_handlers/timeline_lookup.hpp"

namespace timeline_lookup {

std::vector<std::string> list_timeline_names(studio_api::Project &project) {
    std::vector<std::string> names;
    int timeline_count = project.get_timeline_count();
    for (int index = 1; index <= timeline_count; index++) {
        std::optional<studio_api::TimelineHandle> timeline = project.get_timeline_by_index(index);
        if (timeline && *timeline) {
            names.push_back((*timeline)->get_name());
        }
    }
    return names;
}

std::optional<studio_api::TimelineHandle> find_timeline_by_name(studio_api::Project &project,
                                                                const std::string &name) {
    int timeline_count = project.get_timeline_count();
    for (int index = 1; index <= timeline_count; index++) {
        std::optional<studio_api::TimelineHandle> timeline = project.get_timeline_by_index(index);
        if (timeline && *timeline && (*timeline)->get_name() == name) {
            return timeline;
        }
    }
    return std::nullopt;
}

} // namespace timeline_lookup

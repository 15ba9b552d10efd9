#ifndef EDMCPS_TIMELINE_LOOKUP_HPP
#define EDMCPS_TIMELINE_LOOKUP_HPP

// Timeline scans over a project, by 1-based index from 1 to the timeline
// count. Indices the application reports as empty are skipped.

#include <optional>
#include <string>
#include <vector>

#include "studio/studio_api.hpp"

namespace timeline_lookup {

// Names in index order. Duplicates are kept.
std::vector<std::string> list_timeline_names(studio_api::Project &project);

// First timeline whose name matches exactly (case-sensitive). When several
// share the name, the lowest index wins.
std::optional<studio_api::TimelineHandle> find_timeline_by_name(studio_api::Project &project,
                                                                const std::string &name);

} // namespace timeline_lookup

#endif // EDMCPS_TIMELINE_LOOKUP_HPP

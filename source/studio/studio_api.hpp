#ifndef EDMCPS_STUDIO_API_HPP
#define EDMCPS_STUDIO_API_HPP

// Studio application abstraction interface.
// The host application's scripting surface is an object graph reached from a
// single root (Studio). Each backend (the in-process simulation, or a bridge
// to a running application) implements these classes. This keeps the
// tool_handlers layer decoupled from how the application is reached.
//
// Every accessor that can come back empty returns std::optional; an engaged
// optional never holds a null pointer. Any call may also throw (StudioError
// or another std::exception) when the application misbehaves.

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace studio_api {

// Raised by backends for failures inside the application itself.
class StudioError : public std::runtime_error {
public:
    explicit StudioError(const std::string &message) : std::runtime_error(message) {}
};

class Studio;
class ProjectManager;
class Project;
class MediaPool;
class MediaPoolItem;
class Bin;
class Timeline;

using ProjectManagerHandle = std::shared_ptr<ProjectManager>;
using ProjectHandle = std::shared_ptr<Project>;
using MediaPoolHandle = std::shared_ptr<MediaPool>;
using MediaPoolItemHandle = std::shared_ptr<MediaPoolItem>;
using BinHandle = std::shared_ptr<Bin>;
using TimelineHandle = std::shared_ptr<Timeline>;

// Wraps a possibly-null pointer from a backend into the optional convention.
template <typename T>
std::optional<std::shared_ptr<T>> present(std::shared_ptr<T> pointer) {
    if (!pointer) {
        return std::nullopt;
    }
    return pointer;
}

// Marker placed on a timeline.
struct MarkerSpec {
    int frame = 0;
    std::string color = "Blue";
    std::string name;
    std::string note;
    int duration = 1;
};

// Track kinds accepted by Timeline::get_track_count.
enum class TrackType {
    Video,
    Audio,
    Subtitle
};

const char *track_type_name(TrackType type);

class Timeline {
public:
    virtual ~Timeline() = default;

    virtual std::string get_name() = 0;
    virtual int get_track_count(TrackType type) = 0;
    virtual bool add_marker(const MarkerSpec &marker) = 0;
    virtual bool set_setting(const std::string &setting_name, const std::string &value) = 0;
};

class MediaPoolItem {
public:
    virtual ~MediaPoolItem() = default;

    virtual std::string get_name() = 0;
    virtual std::string get_file_path() = 0;
};

class Bin {
public:
    virtual ~Bin() = default;

    virtual std::string get_name() = 0;
};

class MediaPool {
public:
    virtual ~MediaPool() = default;

    // Imports a batch of files. Returns the clips that were created; an empty
    // vector means nothing was imported.
    virtual std::vector<MediaPoolItemHandle> import_media(const std::vector<std::string> &file_paths) = 0;

    virtual std::optional<BinHandle> create_bin(const std::string &name) = 0;
    virtual std::optional<TimelineHandle> create_empty_timeline(const std::string &name) = 0;

    // Clip lookup by name across all bins.
    virtual std::optional<MediaPoolItemHandle> find_clip(const std::string &name) = 0;

    // Appends clips to the project's current timeline.
    virtual bool append_to_timeline(const std::vector<MediaPoolItemHandle> &clips) = 0;
};

class Project {
public:
    virtual ~Project() = default;

    virtual std::string get_name() = 0;
    virtual int get_timeline_count() = 0;

    // 1-based, inclusive of get_timeline_count().
    virtual std::optional<TimelineHandle> get_timeline_by_index(int index) = 0;

    virtual std::optional<TimelineHandle> get_current_timeline() = 0;
    virtual bool set_current_timeline(const TimelineHandle &timeline) = 0;
    virtual bool delete_timelines(const std::vector<TimelineHandle> &timelines) = 0;

    virtual std::optional<MediaPoolHandle> get_media_pool() = 0;
    virtual bool set_setting(const std::string &setting_name, const std::string &value) = 0;
};

class ProjectManager {
public:
    virtual ~ProjectManager() = default;

    virtual std::optional<ProjectHandle> create_project(const std::string &name) = 0;
    virtual std::optional<ProjectHandle> load_project(const std::string &name) = 0;
    virtual bool save_project() = 0;
    virtual bool close_project(const ProjectHandle &project) = 0;
    virtual std::optional<ProjectHandle> get_current_project() = 0;
    virtual std::vector<std::string> list_projects() = 0;
};

// Root of the object graph, obtained once at process start.
class Studio {
public:
    virtual ~Studio() = default;

    // False when the application cannot be reached at all.
    virtual bool is_running() = 0;

    virtual std::optional<ProjectManagerHandle> get_project_manager() = 0;

    // Page names are validated by the application, not here.
    virtual bool open_page(const std::string &page) = 0;

    virtual std::string get_product_name() = 0;
    virtual std::string get_version_string() = 0;
};

} // namespace studio_api

#endif // EDMCPS_STUDIO_API_HPP

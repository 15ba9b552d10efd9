#ifndef EDMCPS_SIM_STUDIO_HPP
#define EDMCPS_SIM_STUDIO_HPP

// In-memory studio backend.
// Implements the studio_api object graph without a running application:
// projects, timelines (duplicate names allowed), bins, clips and pages.
// Also lets callers change state behind the server's back and inject
// failures, which is how the refresh and error paths get exercised.

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "studio/studio_api.hpp"

namespace studio_sim {

// Shared by every object of one simulated application.
struct SimControl {
    bool running = true;

    // The next failing_calls API calls throw StudioError(failure_message).
    int failing_calls = 0;
    std::string failure_message = "simulated application failure";

    bool set_current_timeline_fails = false;
    bool import_returns_empty = false;
    bool import_returns_null_handles = false;
    bool create_timeline_fails = false;

    // Mutating calls that reached the application, in order ("CreateBin:Foo").
    std::vector<std::string> journal;
    int call_count = 0;

    // Counts the call and throws if a failure is pending.
    void check(const std::string &operation);
    void record(const std::string &entry);
};

using SimControlHandle = std::shared_ptr<SimControl>;

class SimProject;

class SimTimeline : public studio_api::Timeline {
public:
    SimTimeline(SimControlHandle control, const std::string &name);

    std::string get_name() override;
    int get_track_count(studio_api::TrackType type) override;
    bool add_marker(const studio_api::MarkerSpec &marker) override;
    bool set_setting(const std::string &setting_name, const std::string &value) override;

    // Inspection helpers (not part of studio_api).
    const std::string &name() const { return name_; }
    const std::vector<studio_api::MarkerSpec> &markers() const { return markers_; }
    const std::map<std::string, std::string> &settings() const { return settings_; }
    const std::vector<std::string> &clip_names() const { return clip_names_; }
    void append_clip(const std::string &clip_name) { clip_names_.push_back(clip_name); }

private:
    SimControlHandle control_;
    std::string name_;
    int video_tracks_ = 1;
    int audio_tracks_ = 1;
    std::vector<studio_api::MarkerSpec> markers_;
    std::map<std::string, std::string> settings_;
    std::vector<std::string> clip_names_;
};

class SimMediaPoolItem : public studio_api::MediaPoolItem {
public:
    SimMediaPoolItem(SimControlHandle control, const std::string &name, const std::string &file_path);

    std::string get_name() override;
    std::string get_file_path() override;

private:
    SimControlHandle control_;
    std::string name_;
    std::string file_path_;
};

class SimBin : public studio_api::Bin {
public:
    SimBin(SimControlHandle control, const std::string &name);

    std::string get_name() override;

    const std::string &name() const { return name_; }

private:
    SimControlHandle control_;
    std::string name_;
};

class SimMediaPool : public studio_api::MediaPool {
public:
    SimMediaPool(SimControlHandle control, std::weak_ptr<SimProject> project);

    std::vector<studio_api::MediaPoolItemHandle> import_media(const std::vector<std::string> &file_paths) override;
    std::optional<studio_api::BinHandle> create_bin(const std::string &name) override;
    std::optional<studio_api::TimelineHandle> create_empty_timeline(const std::string &name) override;
    std::optional<studio_api::MediaPoolItemHandle> find_clip(const std::string &name) override;
    bool append_to_timeline(const std::vector<studio_api::MediaPoolItemHandle> &clips) override;

    int count_bins(const std::string &name) const;
    size_t clip_count() const { return clips_.size(); }

private:
    std::shared_ptr<SimProject> lock_project(const std::string &operation);

    SimControlHandle control_;
    std::weak_ptr<SimProject> project_;
    std::vector<std::shared_ptr<SimBin>> bins_;
    std::vector<std::shared_ptr<SimMediaPoolItem>> clips_;
};

class SimProject : public studio_api::Project, public std::enable_shared_from_this<SimProject> {
    // Only create() can name this, so projects always live in a shared_ptr.
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    static std::shared_ptr<SimProject> create(SimControlHandle control, const std::string &name);
    SimProject(ConstructionKey key, SimControlHandle control, const std::string &name);

    std::string get_name() override;
    int get_timeline_count() override;
    std::optional<studio_api::TimelineHandle> get_timeline_by_index(int index) override;
    std::optional<studio_api::TimelineHandle> get_current_timeline() override;
    bool set_current_timeline(const studio_api::TimelineHandle &timeline) override;
    bool delete_timelines(const std::vector<studio_api::TimelineHandle> &timelines) override;
    std::optional<studio_api::MediaPoolHandle> get_media_pool() override;
    bool set_setting(const std::string &setting_name, const std::string &value) override;

    // Used by the media pool and by out-of-band changes.
    std::shared_ptr<SimTimeline> add_timeline(const std::string &name);
    std::shared_ptr<SimTimeline> find_timeline(const std::string &name) const;
    std::shared_ptr<SimTimeline> current_timeline() const { return current_timeline_; }
    void force_current_timeline(std::shared_ptr<SimTimeline> timeline) { current_timeline_ = std::move(timeline); }
    std::shared_ptr<SimMediaPool> sim_media_pool() const { return media_pool_; }
    std::vector<std::string> timeline_names() const;
    const std::string &name() const { return name_; }
    const std::map<std::string, std::string> &settings() const { return settings_; }

    // Set false to make get_media_pool() come back empty.
    bool media_pool_available = true;

private:
    SimControlHandle control_;
    std::string name_;
    std::vector<std::shared_ptr<SimTimeline>> timelines_;
    std::shared_ptr<SimTimeline> current_timeline_;
    std::shared_ptr<SimMediaPool> media_pool_;
    std::map<std::string, std::string> settings_;
};

class SimProjectManager : public studio_api::ProjectManager {
public:
    explicit SimProjectManager(SimControlHandle control);

    std::optional<studio_api::ProjectHandle> create_project(const std::string &name) override;
    std::optional<studio_api::ProjectHandle> load_project(const std::string &name) override;
    bool save_project() override;
    bool close_project(const studio_api::ProjectHandle &project) override;
    std::optional<studio_api::ProjectHandle> get_current_project() override;
    std::vector<std::string> list_projects() override;

    std::shared_ptr<SimProject> find_sim_project(const std::string &name) const;
    std::shared_ptr<SimProject> current_sim_project() const { return current_project_; }
    void force_current_project(std::shared_ptr<SimProject> project) { current_project_ = std::move(project); }
    int save_count() const { return save_count_; }

private:
    SimControlHandle control_;
    std::vector<std::shared_ptr<SimProject>> projects_;
    std::shared_ptr<SimProject> current_project_;
    int save_count_ = 0;
};

class SimStudio : public studio_api::Studio {
public:
    SimStudio();

    bool is_running() override;
    std::optional<studio_api::ProjectManagerHandle> get_project_manager() override;
    bool open_page(const std::string &page) override;
    std::string get_product_name() override;
    std::string get_version_string() override;

    SimControl &control() { return *control_; }
    std::shared_ptr<SimProjectManager> manager() const { return manager_; }
    const std::string &current_page() const { return current_page_; }

    // Out-of-band changes, as if a person were using the application.
    void sim_close_project_externally();
    bool sim_set_current_timeline_externally(const std::string &name);
    std::shared_ptr<SimTimeline> sim_add_timeline_externally(const std::string &name);

private:
    SimControlHandle control_;
    std::shared_ptr<SimProjectManager> manager_;
    std::string current_page_ = "edit";
};

} // namespace studio_sim

#endif // EDMCPS_SIM_STUDIO_HPP

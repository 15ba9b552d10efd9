#include "studio/sim/sim_studio.hpp"

#include <algorithm>

namespace studio_sim {

using studio_api::BinHandle;
using studio_api::MediaPoolHandle;
using studio_api::MediaPoolItemHandle;
using studio_api::ProjectHandle;
using studio_api::ProjectManagerHandle;
using studio_api::TimelineHandle;

static const char *const kValidPages[] = {
    "media", "cut", "edit", "fusion", "color", "fairlight", "deliver"
};

// Last path component, as the application names imported clips.
static std::string file_name_of(const std::string &file_path) {
    size_t separator = file_path.find_last_of("/\\");
    if (separator == std::string::npos) {
        return file_path;
    }
    return file_path.substr(separator + 1);
}

// --- SimControl ---

void SimControl::check(const std::string &operation) {
    call_count++;
    if (failing_calls > 0) {
        failing_calls--;
        throw studio_api::StudioError(failure_message + " (" + operation + ")");
    }
}

void SimControl::record(const std::string &entry) {
    journal.push_back(entry);
}

// --- SimTimeline ---

SimTimeline::SimTimeline(SimControlHandle control, const std::string &name)
    : control_(std::move(control)), name_(name) {}

std::string SimTimeline::get_name() {
    control_->check("Timeline.GetName");
    return name_;
}

int SimTimeline::get_track_count(studio_api::TrackType type) {
    control_->check("Timeline.GetTrackCount");
    switch (type) {
    case studio_api::TrackType::Video:
        return video_tracks_;
    case studio_api::TrackType::Audio:
        return audio_tracks_;
    case studio_api::TrackType::Subtitle:
        return 0;
    }
    return 0;
}

bool SimTimeline::add_marker(const studio_api::MarkerSpec &marker) {
    control_->check("Timeline.AddMarker");
    if (marker.frame < 0 || marker.duration < 1) {
        return false;
    }
    // One marker per frame, like the application.
    for (const auto &existing : markers_) {
        if (existing.frame == marker.frame) {
            return false;
        }
    }
    markers_.push_back(marker);
    control_->record("AddMarker:" + name_ + "@" + std::to_string(marker.frame));
    return true;
}

bool SimTimeline::set_setting(const std::string &setting_name, const std::string &value) {
    control_->check("Timeline.SetSetting");
    if (setting_name.empty()) {
        return false;
    }
    settings_[setting_name] = value;
    control_->record("Timeline.SetSetting:" + setting_name + "=" + value);
    return true;
}

// --- SimMediaPoolItem / SimBin ---

SimMediaPoolItem::SimMediaPoolItem(SimControlHandle control, const std::string &name, const std::string &file_path)
    : control_(std::move(control)), name_(name), file_path_(file_path) {}

std::string SimMediaPoolItem::get_name() {
    control_->check("MediaPoolItem.GetName");
    return name_;
}

std::string SimMediaPoolItem::get_file_path() {
    control_->check("MediaPoolItem.GetClipProperty");
    return file_path_;
}

SimBin::SimBin(SimControlHandle control, const std::string &name)
    : control_(std::move(control)), name_(name) {}

std::string SimBin::get_name() {
    control_->check("Folder.GetName");
    return name_;
}

// --- SimMediaPool ---

SimMediaPool::SimMediaPool(SimControlHandle control, std::weak_ptr<SimProject> project)
    : control_(std::move(control)), project_(std::move(project)) {}

std::shared_ptr<SimProject> SimMediaPool::lock_project(const std::string &operation) {
    std::shared_ptr<SimProject> project = project_.lock();
    if (!project) {
        throw studio_api::StudioError("media pool used after its project was released (" + operation + ")");
    }
    return project;
}

std::vector<MediaPoolItemHandle> SimMediaPool::import_media(const std::vector<std::string> &file_paths) {
    control_->check("MediaPool.ImportMedia");
    std::vector<MediaPoolItemHandle> imported;
    if (control_->import_returns_empty) {
        return imported;
    }
    if (control_->import_returns_null_handles) {
        imported.resize(file_paths.size());
        return imported;
    }
    for (const auto &file_path : file_paths) {
        if (file_path.empty()) {
            continue;
        }
        auto clip = std::make_shared<SimMediaPoolItem>(control_, file_name_of(file_path), file_path);
        clips_.push_back(clip);
        imported.push_back(clip);
        control_->record("ImportMedia:" + file_path);
    }
    return imported;
}

std::optional<BinHandle> SimMediaPool::create_bin(const std::string &name) {
    control_->check("MediaPool.AddSubFolder");
    if (name.empty()) {
        return std::nullopt;
    }
    auto bin = std::make_shared<SimBin>(control_, name);
    bins_.push_back(bin);
    control_->record("CreateBin:" + name);
    return BinHandle(bin);
}

std::optional<TimelineHandle> SimMediaPool::create_empty_timeline(const std::string &name) {
    control_->check("MediaPool.CreateEmptyTimeline");
    std::shared_ptr<SimProject> project = lock_project("MediaPool.CreateEmptyTimeline");
    if (name.empty() || control_->create_timeline_fails) {
        return std::nullopt;
    }
    std::shared_ptr<SimTimeline> timeline = project->add_timeline(name);
    control_->record("CreateEmptyTimeline:" + name);
    return TimelineHandle(timeline);
}

std::optional<MediaPoolItemHandle> SimMediaPool::find_clip(const std::string &name) {
    control_->check("MediaPool.GetClipList");
    for (const auto &clip : clips_) {
        if (clip->get_name() == name) {
            return MediaPoolItemHandle(clip);
        }
    }
    return std::nullopt;
}

bool SimMediaPool::append_to_timeline(const std::vector<MediaPoolItemHandle> &clips) {
    control_->check("MediaPool.AppendToTimeline");
    std::shared_ptr<SimProject> project = lock_project("MediaPool.AppendToTimeline");
    std::shared_ptr<SimTimeline> timeline = project->current_timeline();
    if (!timeline || clips.empty()) {
        return false;
    }
    for (const auto &clip : clips) {
        if (!clip) {
            return false;
        }
    }
    for (const auto &clip : clips) {
        std::string clip_name = clip->get_name();
        timeline->append_clip(clip_name);
        control_->record("AppendToTimeline:" + clip_name + "->" + timeline->name());
    }
    return true;
}

int SimMediaPool::count_bins(const std::string &name) const {
    return static_cast<int>(std::count_if(bins_.begin(), bins_.end(),
                                          [&name](const std::shared_ptr<SimBin> &bin) { return bin->name() == name; }));
}

// --- SimProject ---

SimProject::SimProject(ConstructionKey, SimControlHandle control, const std::string &name)
    : control_(std::move(control)), name_(name) {}

std::shared_ptr<SimProject> SimProject::create(SimControlHandle control, const std::string &name) {
    std::shared_ptr<SimProject> project = std::make_shared<SimProject>(ConstructionKey(), control, name);
    project->media_pool_ = std::make_shared<SimMediaPool>(control, std::weak_ptr<SimProject>(project));
    return project;
}

std::string SimProject::get_name() {
    control_->check("Project.GetName");
    return name_;
}

int SimProject::get_timeline_count() {
    control_->check("Project.GetTimelineCount");
    return static_cast<int>(timelines_.size());
}

std::optional<TimelineHandle> SimProject::get_timeline_by_index(int index) {
    control_->check("Project.GetTimelineByIndex");
    if (index < 1 || index > static_cast<int>(timelines_.size())) {
        return std::nullopt;
    }
    return TimelineHandle(timelines_[static_cast<size_t>(index - 1)]);
}

std::optional<TimelineHandle> SimProject::get_current_timeline() {
    control_->check("Project.GetCurrentTimeline");
    return studio_api::present<studio_api::Timeline>(current_timeline_);
}

bool SimProject::set_current_timeline(const TimelineHandle &timeline) {
    control_->check("Project.SetCurrentTimeline");
    if (control_->set_current_timeline_fails || !timeline) {
        return false;
    }
    for (const auto &owned : timelines_) {
        if (owned.get() == timeline.get()) {
            current_timeline_ = owned;
            control_->record("SetCurrentTimeline:" + owned->name());
            return true;
        }
    }
    return false;
}

bool SimProject::delete_timelines(const std::vector<TimelineHandle> &timelines) {
    control_->check("MediaPool.DeleteTimelines");
    bool all_found = !timelines.empty();
    for (const auto &timeline : timelines) {
        auto match = std::find_if(timelines_.begin(), timelines_.end(),
                                  [&timeline](const std::shared_ptr<SimTimeline> &owned) {
                                      return owned.get() == timeline.get();
                                  });
        if (match == timelines_.end()) {
            all_found = false;
            continue;
        }
        if (current_timeline_ == *match) {
            current_timeline_.reset();
        }
        control_->record("DeleteTimeline:" + (*match)->name());
        timelines_.erase(match);
    }
    return all_found;
}

std::optional<MediaPoolHandle> SimProject::get_media_pool() {
    control_->check("Project.GetMediaPool");
    if (!media_pool_available) {
        return std::nullopt;
    }
    return MediaPoolHandle(media_pool_);
}

bool SimProject::set_setting(const std::string &setting_name, const std::string &value) {
    control_->check("Project.SetSetting");
    if (setting_name.empty()) {
        return false;
    }
    settings_[setting_name] = value;
    control_->record("Project.SetSetting:" + setting_name + "=" + value);
    return true;
}

std::shared_ptr<SimTimeline> SimProject::add_timeline(const std::string &name) {
    auto timeline = std::make_shared<SimTimeline>(control_, name);
    timelines_.push_back(timeline);
    return timeline;
}

std::shared_ptr<SimTimeline> SimProject::find_timeline(const std::string &name) const {
    for (const auto &timeline : timelines_) {
        if (timeline->name() == name) {
            return timeline;
        }
    }
    return nullptr;
}

std::vector<std::string> SimProject::timeline_names() const {
    std::vector<std::string> names;
    for (const auto &timeline : timelines_) {
        names.push_back(timeline->name());
    }
    return names;
}

// --- SimProjectManager ---

SimProjectManager::SimProjectManager(SimControlHandle control)
    : control_(std::move(control)) {}

std::optional<ProjectHandle> SimProjectManager::create_project(const std::string &name) {
    control_->check("ProjectManager.CreateProject");
    if (name.empty() || find_sim_project(name)) {
        return std::nullopt;
    }
    std::shared_ptr<SimProject> project = SimProject::create(control_, name);
    projects_.push_back(project);
    current_project_ = project;
    control_->record("CreateProject:" + name);
    return ProjectHandle(project);
}

std::optional<ProjectHandle> SimProjectManager::load_project(const std::string &name) {
    control_->check("ProjectManager.LoadProject");
    std::shared_ptr<SimProject> project = find_sim_project(name);
    if (!project) {
        return std::nullopt;
    }
    current_project_ = project;
    control_->record("LoadProject:" + name);
    return ProjectHandle(project);
}

bool SimProjectManager::save_project() {
    control_->check("ProjectManager.SaveProject");
    if (!current_project_) {
        return false;
    }
    save_count_++;
    control_->record("SaveProject:" + current_project_->name());
    return true;
}

bool SimProjectManager::close_project(const ProjectHandle &project) {
    control_->check("ProjectManager.CloseProject");
    if (!project || !current_project_ || project.get() != current_project_.get()) {
        return false;
    }
    control_->record("CloseProject:" + current_project_->name());
    current_project_.reset();
    return true;
}

std::optional<ProjectHandle> SimProjectManager::get_current_project() {
    control_->check("ProjectManager.GetCurrentProject");
    return studio_api::present<studio_api::Project>(current_project_);
}

std::vector<std::string> SimProjectManager::list_projects() {
    control_->check("ProjectManager.GetProjectListInCurrentFolder");
    std::vector<std::string> names;
    for (const auto &project : projects_) {
        names.push_back(project->name());
    }
    return names;
}

std::shared_ptr<SimProject> SimProjectManager::find_sim_project(const std::string &name) const {
    for (const auto &project : projects_) {
        if (project->name() == name) {
            return project;
        }
    }
    return nullptr;
}

// --- SimStudio ---

SimStudio::SimStudio()
    : control_(std::make_shared<SimControl>()),
      manager_(std::make_shared<SimProjectManager>(control_)) {}

bool SimStudio::is_running() {
    return control_->running;
}

std::optional<ProjectManagerHandle> SimStudio::get_project_manager() {
    control_->check("Resolve.GetProjectManager");
    if (!control_->running) {
        return std::nullopt;
    }
    return ProjectManagerHandle(manager_);
}

bool SimStudio::open_page(const std::string &page) {
    control_->check("Resolve.OpenPage");
    if (!control_->running) {
        return false;
    }
    for (const char *valid_page : kValidPages) {
        if (page == valid_page) {
            current_page_ = page;
            control_->record("OpenPage:" + page);
            return true;
        }
    }
    return false;
}

std::string SimStudio::get_product_name() {
    control_->check("Resolve.GetProductName");
    return "Simulated Studio";
}

std::string SimStudio::get_version_string() {
    control_->check("Resolve.GetVersionString");
    return "0.0.0-sim";
}

void SimStudio::sim_close_project_externally() {
    manager_->force_current_project(nullptr);
}

bool SimStudio::sim_set_current_timeline_externally(const std::string &name) {
    std::shared_ptr<SimProject> project = manager_->current_sim_project();
    if (!project) {
        return false;
    }
    std::shared_ptr<SimTimeline> timeline = project->find_timeline(name);
    if (!timeline) {
        return false;
    }
    project->force_current_timeline(timeline);
    return true;
}

std::shared_ptr<SimTimeline> SimStudio::sim_add_timeline_externally(const std::string &name) {
    std::shared_ptr<SimProject> project = manager_->current_sim_project();
    if (!project) {
        return nullptr;
    }
    return project->add_timeline(name);
}

} // namespace studio_sim

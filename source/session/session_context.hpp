#ifndef EDMCPS_SESSION_CONTEXT_HPP
#define EDMCPS_SESSION_CONTEXT_HPP

// Session context: the current project, media pool and timeline that every
// tool call implicitly works against.
//
// The application is authoritative and may change any of these while the
// server is idle (a person closes the project, picks another timeline), so
// the context is re-derived before every call and never patched in place.
// Invariant: media pool and timeline are only ever present together with a
// project.

#include <optional>
#include <utility>

#include "studio/studio_api.hpp"

namespace session_context {

struct SessionContext {
    std::optional<studio_api::ProjectHandle> current_project;
    std::optional<studio_api::MediaPoolHandle> current_media_pool;
    std::optional<studio_api::TimelineHandle> current_timeline;
};

// A context that has just been re-derived from the application.
// Only refresh_context() can make one, so anything taking a RefreshedContext
// is guaranteed to run against fresh state.
class RefreshedContext {
public:
    const SessionContext &context() const { return context_; }

private:
    explicit RefreshedContext(SessionContext context) : context_(std::move(context)) {}

    SessionContext context_;

    friend RefreshedContext refresh_context(studio_api::Studio &studio);
};

// Re-derives the context from the application. Never throws: an unreachable
// application, a missing project or an exception from any accessor all read
// as "absent".
RefreshedContext refresh_context(studio_api::Studio &studio);

// Context for a project that just became current (created or opened):
// the project and its media pool, no timeline. Never throws.
SessionContext context_for_project(const studio_api::ProjectHandle &project);

// True when the dependent fields respect the project invariant.
bool is_consistent(const SessionContext &context);

} // namespace session_context

#endif // EDMCPS_SESSION_CONTEXT_HPP

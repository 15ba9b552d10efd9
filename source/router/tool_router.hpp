#ifndef EDMCPS_TOOL_ROUTER_HPP
#define EDMCPS_TOOL_ROUTER_HPP

// Routes a tools/call to its handler group.
// Arguments are validated against the tool's schema, the category tag picks
// the group, and the group picks the handler by method identifier. Anything
// the application throws is turned into a failure outcome here, so one bad
// call never takes down the session loop.

#include <nlohmann/json.hpp>

#include "mcp/mcp_tools.hpp"
#include "router/tool_category.hpp"
#include "session/session_context.hpp"
#include "studio/studio_api.hpp"
#include "tool_handlers/handler_outcome.hpp"

namespace tool_router {

using json = nlohmann::json;

// The refreshed context is taken by value; handlers get their own snapshot.
handler_outcome::Outcome route_call(studio_api::Studio &studio,
                                    session_context::RefreshedContext refreshed,
                                    const mcp_tools::ToolDefinition &tool,
                                    const json &arguments);

} // namespace tool_router

#endif // EDMCPS_TOOL_ROUTER_HPP

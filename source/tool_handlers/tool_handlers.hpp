#ifndef EDMCPS_TOOL_HANDLERS_HPP
#define EDMCPS_TOOL_HANDLERS_HPP

// Tool handler groups.
// Each *_handlers.cpp registers its tools with the catalog and provides the
// group's handle() entry point, which picks a handler by method identifier.
// Handlers read the context snapshot they are given and never keep it.

#include <nlohmann/json.hpp>
#include <string>

#include "session/session_context.hpp"
#include "studio/studio_api.hpp"
#include "tool_handlers/handler_outcome.hpp"

namespace tool_handlers {

// Register all available tools with the MCP tool catalog.
// Schema defaults for timeline settings come from server_config::current(),
// so call this after the configuration has been installed.
void register_all_tools();

} // namespace tool_handlers

namespace general_handlers {
void register_tools();
handler_outcome::Outcome handle(studio_api::Studio &studio,
                                session_context::SessionContext context,
                                const std::string &method,
                                const nlohmann::json &arguments);
} // namespace general_handlers

namespace project_handlers {
void register_tools();
handler_outcome::Outcome handle(studio_api::Studio &studio,
                                session_context::SessionContext context,
                                const std::string &method,
                                const nlohmann::json &arguments);
} // namespace project_handlers

namespace timeline_handlers {
void register_tools();
handler_outcome::Outcome handle(session_context::SessionContext context,
                                const std::string &method,
                                const nlohmann::json &arguments);
} // namespace timeline_handlers

namespace media_handlers {
void register_tools();
handler_outcome::Outcome handle(session_context::SessionContext context,
                                const std::string &method,
                                const nlohmann::json &arguments);
} // namespace media_handlers

namespace color_handlers {
void register_tools();
handler_outcome::Outcome handle(session_context::SessionContext context,
                                const std::string &method,
                                const nlohmann::json &arguments);
} // namespace color_handlers

namespace render_handlers {
void register_tools();
handler_outcome::Outcome handle(session_context::SessionContext context,
                                const std::string &method,
                                const nlohmann::json &arguments);
} // namespace render_handlers

#endif // EDMCPS_TOOL_HANDLERS_HPP

#ifndef EDMCPS_HANDLER_OUTCOME_HPP
#define EDMCPS_HANDLER_OUTCOME_HPP

// Result of one tool handler, and its conversion to the MCP tool result
// payload ({content: [...], is_error}).

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "session/session_context.hpp"

namespace handler_outcome {

using json = nlohmann::json;

struct Outcome {
    bool success = false;
    std::string message;  // human-readable text (reason, on failure)
    json value;           // structured payload, null when the handler has none

    // Set by the handlers that move a "current" pointer (project create/open/
    // close, set current timeline). The session installs it after the call.
    std::optional<session_context::SessionContext> updated_context;
};

Outcome success(const std::string &message);
Outcome success(const std::string &message, const json &value);
Outcome failure(const std::string &reason);

// Text block first, then the structured value (if any) as a JSON text block.
// Both "is_error" and the MCP spelling "isError" are set.
json to_tool_result(const Outcome &outcome);

} // namespace handler_outcome

#endif // EDMCPS_HANDLER_OUTCOME_HPP

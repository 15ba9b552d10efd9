// EDMCPS - Editor Model Context Protocol Server
// Entry point: stdio MCP server loop.
//
// Reads one JSON-RPC 2.0 message per line from stdin, handles it, writes the
// response line to stdout. Logs go to stderr, which the MCP stdio transport leaves free.

#include <nlohmann/json.hpp>
#include <csignal>
#include <optional>
#include <string>

#include "mcp/mcp_session.hpp"
#include "mcp/mcp_stdio.hpp"
#include "studio/sim/sim_studio.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"
#include "utils/server_config.hpp"

using json = nlohmann::json;

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

int main() {
    mcp_stdio::log_message("edmcps - Editor MCP Server, build " + std::string(__DATE__) + " " + __TIME__);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    server_config::ServerConfig config = server_config::load_from_environment();
    server_config::set_current(config);
    debug_log::set_level(config.log_level);
    debug_log::log(std::string("log level ") + debug_log::level_name(config.log_level));

    // Schema defaults read the installed config, so register after set_current.
    tool_handlers::register_all_tools();

    studio_sim::SimStudio studio;
    mcp_session::Session session(studio);

    mcp_stdio::log_message("edmcps started. Waiting for MCP messages on stdin.");

    while (!shutdown_requested) {
        std::optional<std::string> line = mcp_stdio::read_message();
        if (!line) {
            // EOF on stdin means the client disconnected.
            mcp_stdio::log_message("EOF on stdin. Shutting down.");
            break;
        }

        json response = session.handle_line(*line);

        // Notifications return null (no response needed).
        if (response.is_null()) {
            continue;
        }
        mcp_stdio::write_message(response.dump(-1, ' ', false, json::error_handler_t::replace));
    }

    session.terminate();
    mcp_stdio::log_message("edmcps shut down.");
    return 0;
}

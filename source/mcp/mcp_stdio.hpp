#ifndef EDMCPS_MCP_STDIO_HPP
#define EDMCPS_MCP_STDIO_HPP

// MCP stdio transport: one JSON message per line on stdin and stdout.
// stderr carries diagnostics only.

#include <iosfwd>
#include <optional>
#include <string>

namespace mcp_stdio {

// Read the next non-blank line from input (trailing '\r' removed).
// Returns std::nullopt at end of input.
std::optional<std::string> read_message(std::istream &input);
std::optional<std::string> read_message();

// Write one message followed by a newline, then flush.
void write_message(std::ostream &output, const std::string &json_string);
void write_message(const std::string &json_string);

// Write a log message to stderr, regardless of the configured log level.
void log_message(const std::string &message);

} // namespace mcp_stdio

#endif // EDMCPS_MCP_STDIO_HPP

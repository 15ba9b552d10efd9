#ifndef EDMCPS_DEBUG_LOG_HPP
#define EDMCPS_DEBUG_LOG_HPP

// Leveled diagnostic logging to stderr (stdout carries protocol data only).

#include <string>

namespace debug_log {

enum class Level {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

// Parses "error" | "warn" | "info" | "debug" (case-insensitive).
// Returns false and leaves output_level untouched for anything else.
bool parse_level(const std::string &text, Level &output_level);

const char *level_name(Level level);

// Sets the threshold. Messages above it are dropped. Default: Info.
void set_level(Level level);
Level get_level();

// Returns true if EDMCPS_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_env_enabled();

// True when debug messages would currently be written.
bool is_debug_enabled();

// Writes "[edmcps] <message>" to stderr when level is at or below the threshold.
void write(Level level, const std::string &message);

// Debug-level shorthand, used throughout the handlers.
void log(const std::string &message);

void info(const std::string &message);
void warn(const std::string &message);
void error(const std::string &message);

} // namespace debug_log

#endif // EDMCPS_DEBUG_LOG_HPP

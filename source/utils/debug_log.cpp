#include "utils/debug_log.hpp"

#include <cstdlib>
#include <cctype>
#include <iostream>
#include <algorithm>
#include <string>

namespace debug_log {

static Level current_level = Level::Info;

static std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

bool parse_level(const std::string &text, Level &output_level) {
    std::string normalized = to_lower(text);
    if (normalized == "error") {
        output_level = Level::Error;
    } else if (normalized == "warn" || normalized == "warning") {
        output_level = Level::Warn;
    } else if (normalized == "info") {
        output_level = Level::Info;
    } else if (normalized == "debug" || normalized == "trace") {
        output_level = Level::Debug;
    } else {
        return false;
    }
    return true;
}

const char *level_name(Level level) {
    switch (level) {
    case Level::Error:
        return "error";
    case Level::Warn:
        return "warn";
    case Level::Info:
        return "info";
    case Level::Debug:
        return "debug";
    }
    return "info";
}

void set_level(Level level) {
    current_level = level;
}

Level get_level() {
    return current_level;
}

bool is_debug_env_enabled() {
    const char *value = std::getenv("EDMCPS_DEBUG");
    if (value == nullptr || value[0] == '\0') {
        return false;
    }
    std::string normalized = to_lower(std::string(value));
    return (normalized == "1" || normalized == "true" || normalized == "yes");
}

bool is_debug_enabled() {
    return current_level >= Level::Debug;
}

void write(Level level, const std::string &message) {
    if (level > current_level) {
        return;
    }
    if (level == Level::Debug || level == Level::Info) {
        std::cerr << "[edmcps] " << message << std::endl;
    } else {
        std::cerr << "[edmcps] " << level_name(level) << ": " << message << std::endl;
    }
}

void log(const std::string &message) {
    write(Level::Debug, message);
}

void info(const std::string &message) {
    write(Level::Info, message);
}

void warn(const std::string &message) {
    write(Level::Warn, message);
}

void error(const std::string &message) {
    write(Level::Error, message);
}

} // namespace debug_log

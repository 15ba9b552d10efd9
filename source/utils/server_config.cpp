#include "utils/server_config.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace server_config {

static ServerConfig active_config;

static bool is_int_value(const json &value) {
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    }
    if (!value.is_number_integer()) {
        return false;
    }
    std::int64_t number = value.get<std::int64_t>();
    return number >= std::numeric_limits<int>::min() && number <= std::numeric_limits<int>::max();
}

std::string validate(const ServerConfig &config) {
    const std::string &frame_rate = config.default_project.frame_rate;
    if (frame_rate.empty()) {
        return "Invalid frame rate: empty";
    }
    std::istringstream frame_rate_stream(frame_rate);
    double parsed_rate = 0.0;
    frame_rate_stream >> parsed_rate;
    if (frame_rate_stream.fail() || !frame_rate_stream.eof() || parsed_rate <= 0.0) {
        return "Invalid frame rate: " + frame_rate;
    }
    if (config.default_project.width <= 0 || config.default_project.height <= 0) {
        return "Invalid default resolution: " + std::to_string(config.default_project.width) +
               "x" + std::to_string(config.default_project.height);
    }
    return "";
}

ConfigResult apply_json(const ServerConfig &base, const json &document) {
    ConfigResult result;
    result.config = base;

    if (!document.is_object()) {
        result.error_detail = "Config root must be a JSON object";
        return result;
    }

    if (document.contains("logging")) {
        const json &logging = document["logging"];
        if (!logging.is_object()) {
            result.error_detail = "'logging' must be an object";
            return result;
        }
        if (logging.contains("level")) {
            if (!logging["level"].is_string()) {
                result.error_detail = "'logging.level' must be a string";
                return result;
            }
            std::string level_text = logging["level"].get<std::string>();
            if (!debug_log::parse_level(level_text, result.config.log_level)) {
                result.error_detail = "Invalid log level: " + level_text;
                return result;
            }
        }
    }

    if (document.contains("default_project")) {
        const json &project = document["default_project"];
        if (!project.is_object()) {
            result.error_detail = "'default_project' must be an object";
            return result;
        }
        DefaultProjectSettings &defaults = result.config.default_project;
        if (project.contains("frame_rate")) {
            // Accept 24 as well as "24".
            if (project["frame_rate"].is_string()) {
                defaults.frame_rate = project["frame_rate"].get<std::string>();
            } else if (project["frame_rate"].is_number()) {
                std::ostringstream rate_stream;
                rate_stream << project["frame_rate"].get<double>();
                defaults.frame_rate = rate_stream.str();
            } else {
                result.error_detail = "'default_project.frame_rate' must be a string or number";
                return result;
            }
        }
        if (project.contains("width")) {
            if (!is_int_value(project["width"])) {
                result.error_detail = "'default_project.width' must be an integer in int range";
                return result;
            }
            defaults.width = project["width"].get<int>();
        }
        if (project.contains("height")) {
            if (!is_int_value(project["height"])) {
                result.error_detail = "'default_project.height' must be an integer in int range";
                return result;
            }
            defaults.height = project["height"].get<int>();
        }
        if (project.contains("color_space")) {
            if (!project["color_space"].is_string()) {
                result.error_detail = "'default_project.color_space' must be a string";
                return result;
            }
            defaults.color_space = project["color_space"].get<std::string>();
        }
    }

    result.error_detail = validate(result.config);
    result.success = result.error_detail.empty();
    return result;
}

ConfigResult load_file(const ServerConfig &base, const std::string &file_path) {
    ConfigResult result;
    result.config = base;

    std::ifstream file_stream(file_path);
    if (!file_stream.is_open()) {
        result.error_detail = "Cannot open config file: " + file_path;
        return result;
    }

    json document;
    try {
        document = json::parse(file_stream);
    } catch (const json::parse_error &error) {
        result.error_detail = "Failed to parse config file " + file_path + ": " + error.what();
        return result;
    }

    return apply_json(base, document);
}

ServerConfig load_from_environment() {
    ServerConfig config;

    const char *config_path = std::getenv("EDMCPS_CONFIG");
    if (config_path != nullptr && config_path[0] != '\0') {
        ConfigResult file_result = load_file(config, config_path);
        if (file_result.success) {
            config = file_result.config;
        } else {
            debug_log::warn(file_result.error_detail + " (using defaults)");
        }
    }

    const char *level_value = std::getenv("EDMCPS_LOG_LEVEL");
    if (level_value != nullptr && level_value[0] != '\0') {
        if (!debug_log::parse_level(level_value, config.log_level)) {
            debug_log::warn(std::string("Ignoring invalid EDMCPS_LOG_LEVEL: ") + level_value);
        }
    }

    if (debug_log::is_debug_env_enabled()) {
        config.log_level = debug_log::Level::Debug;
    }

    return config;
}

const ServerConfig &current() {
    return active_config;
}

void set_current(const ServerConfig &config) {
    active_config = config;
}

} // namespace server_config

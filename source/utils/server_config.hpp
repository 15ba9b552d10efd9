#ifndef EDMCPS_SERVER_CONFIG_HPP
#define EDMCPS_SERVER_CONFIG_HPP

// Server configuration: built-in defaults, an optional JSON file named by
// EDMCPS_CONFIG, then environment overrides (EDMCPS_LOG_LEVEL, EDMCPS_DEBUG).

#include <nlohmann/json.hpp>
#include <string>

#include "utils/debug_log.hpp"

namespace server_config {

using json = nlohmann::json;

// Settings applied to new timelines when the caller does not provide them.
struct DefaultProjectSettings {
    std::string frame_rate = "24";
    int width = 1920;
    int height = 1080;
    std::string color_space = "Rec.709";
};

struct ServerConfig {
    debug_log::Level log_level = debug_log::Level::Info;
    DefaultProjectSettings default_project;
};

// Result of validating or loading a configuration.
struct ConfigResult {
    bool success = false;
    ServerConfig config;
    std::string error_detail;
};

// Returns an empty string when the config is usable, otherwise the reason.
std::string validate(const ServerConfig &config);

// Overlays the fields present in a parsed config document onto base.
// Unknown keys are ignored; a present key of the wrong JSON type is an error.
ConfigResult apply_json(const ServerConfig &base, const json &document);

// Reads and applies a JSON config file on top of base.
ConfigResult load_file(const ServerConfig &base, const std::string &file_path);

// Full startup load: defaults, EDMCPS_CONFIG file, environment overrides.
// Never fails: problems are logged and the defaults are kept.
ServerConfig load_from_environment();

// The configuration in effect for this process (set once by main).
const ServerConfig &current();
void set_current(const ServerConfig &config);

} // namespace server_config

#endif // EDMCPS_SERVER_CONFIG_HPP

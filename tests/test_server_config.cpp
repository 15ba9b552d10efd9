// Tests for configuration loading, validation and log level parsing.

#include "utils/debug_log.hpp"
#include "utils/server_config.hpp"

#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

using json = nlohmann::json;

namespace test_server_config {

static bool report(bool success, const std::string &description, const std::string &failure_detail) {
    if (success) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << ": " << failure_detail << std::endl;
    }
    return success;
}

// Test: Built-in defaults are valid and match the documented values.
static bool test_defaults() {
    server_config::ServerConfig config;
    bool success = server_config::validate(config).empty() && config.log_level == debug_log::Level::Info &&
                   config.default_project.frame_rate == "24" && config.default_project.width == 1920 &&
                   config.default_project.height == 1080 && config.default_project.color_space == "Rec.709";
    return report(success, "defaults are valid", server_config::validate(config));
}

// Test: A document overlays only the fields it names.
static bool test_apply_json_overlay() {
    json document = {{"logging", {{"level", "debug"}}},
                     {"default_project", {{"frame_rate", 29.97}, {"width", 3840}}},
                     {"unknown_section", true}};
    server_config::ConfigResult result = server_config::apply_json(server_config::ServerConfig(), document);
    bool success = result.success && result.config.log_level == debug_log::Level::Debug &&
                   result.config.default_project.frame_rate == "29.97" &&
                   result.config.default_project.width == 3840 && result.config.default_project.height == 1080;
    return report(success, "config document overlays named fields", result.error_detail);
}

// Test: Wrong types and invalid values are rejected with a reason.
static bool test_apply_json_rejections() {
    server_config::ServerConfig base;
    server_config::ConfigResult bad_level = server_config::apply_json(base, {{"logging", {{"level", "loud"}}}});
    server_config::ConfigResult bad_width =
        server_config::apply_json(base, {{"default_project", {{"width", "wide"}}}});
    server_config::ConfigResult zero_height =
        server_config::apply_json(base, {{"default_project", {{"height", 0}}}});
    server_config::ConfigResult bad_rate =
        server_config::apply_json(base, {{"default_project", {{"frame_rate", "fast"}}}});
    server_config::ConfigResult not_object = server_config::apply_json(base, json::array());
    server_config::ConfigResult huge_width =
        server_config::apply_json(base, json::parse(R"({"default_project":{"width":4294969216}})"));
    server_config::ConfigResult negative_height =
        server_config::apply_json(base, {{"default_project", {{"height", -1080}}}});
    bool success = !bad_level.success && bad_level.error_detail.find("loud") != std::string::npos &&
                   !bad_width.success && !zero_height.success && !bad_rate.success && !not_object.success &&
                   !huge_width.success && huge_width.config.default_project.width == 1920 &&
                   !negative_height.success;
    return report(success, "invalid config values are rejected", bad_rate.error_detail);
}

// Test: A config file on disk is read; a missing or broken file is an error.
static bool test_load_file() {
    std::string file_path = "edmcps_test_config.json";
    {
        std::ofstream file_stream(file_path);
        file_stream << R"({"default_project": {"frame_rate": "25", "height": 720}})";
    }
    server_config::ConfigResult loaded = server_config::load_file(server_config::ServerConfig(), file_path);

    {
        std::ofstream file_stream(file_path);
        file_stream << "{ not json";
    }
    server_config::ConfigResult broken = server_config::load_file(server_config::ServerConfig(), file_path);
    std::remove(file_path.c_str());

    server_config::ConfigResult missing =
        server_config::load_file(server_config::ServerConfig(), "does_not_exist_edmcps.json");
    bool success = loaded.success && loaded.config.default_project.frame_rate == "25" &&
                   loaded.config.default_project.height == 720 && !broken.success && !missing.success;
    return report(success, "config files load, and bad files are reported", loaded.error_detail);
}

// Test: Log level names parse case-insensitively, with aliases.
static bool test_parse_level() {
    debug_log::Level level = debug_log::Level::Info;
    bool warn_parsed = debug_log::parse_level("WARNING", level) && level == debug_log::Level::Warn;
    bool error_parsed = debug_log::parse_level("error", level) && level == debug_log::Level::Error;
    bool rejected = !debug_log::parse_level("verbose", level) && level == debug_log::Level::Error;
    bool success = warn_parsed && error_parsed && rejected &&
                   std::string(debug_log::level_name(debug_log::Level::Debug)) == "debug";
    return report(success, "log levels parse with aliases and reject unknown names", "");
}

// Test: The installed config is what current() returns.
static bool test_set_current() {
    server_config::ServerConfig saved = server_config::current();
    server_config::ServerConfig changed = saved;
    changed.default_project.frame_rate = "60";
    server_config::set_current(changed);
    bool success = server_config::current().default_project.frame_rate == "60";
    server_config::set_current(saved);
    return report(success, "set_current installs the process config", "");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_defaults();
    all_passed &= test_apply_json_overlay();
    all_passed &= test_apply_json_rejections();
    all_passed &= test_load_file();
    all_passed &= test_parse_level();
    all_passed &= test_set_current();
    return all_passed;
}

} // namespace test_server_config

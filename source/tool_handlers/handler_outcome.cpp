#include "tool_handlers/handler_outcome.hpp"

#include "utils/utf8_sanitize.hpp"

namespace handler_outcome {

Outcome success(const std::string &message) {
    Outcome outcome;
    outcome.success = true;
    outcome.message = message;
    return outcome;
}

Outcome success(const std::string &message, const json &value) {
    Outcome outcome = success(message);
    outcome.value = value;
    return outcome;
}

Outcome failure(const std::string &reason) {
    Outcome outcome;
    outcome.success = false;
    outcome.message = reason;
    return outcome;
}

json to_tool_result(const Outcome &outcome) {
    json text_content;
    text_content["type"] = "text";
    text_content["text"] = utf8_sanitize::sanitize(outcome.message);

    json result;
    result["content"] = json::array({text_content});

    if (!outcome.value.is_null()) {
        json value_content;
        value_content["type"] = "text";
        value_content["text"] = outcome.value.dump(-1, ' ', false, json::error_handler_t::replace);
        result["content"].push_back(value_content);
    }

    result["is_error"] = !outcome.success;
    result["isError"] = !outcome.success;
    return result;
}

} // namespace handler_outcome

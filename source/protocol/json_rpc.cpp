#include "protocol/json_rpc.hpp"

namespace json_rpc {

static bool is_valid_id(const json &id) {
    return id.is_string() || id.is_number() || id.is_null();
}

Envelope parse_envelope(const json &message) {
    Envelope envelope;
    envelope.params = json::object();

    if (!message.is_object()) {
        envelope.error_code = INVALID_REQUEST;
        envelope.error_message = "Invalid Request: message must be a JSON object";
        return envelope;
    }

    // Echo the id on errors whenever it is usable, so the client can correlate.
    if (message.contains("id") && is_valid_id(message["id"])) {
        envelope.id = message["id"];
    }

    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        envelope.error_code = INVALID_REQUEST;
        envelope.error_message = "Invalid Request: jsonrpc must be \"2.0\"";
        return envelope;
    }

    if (message.contains("id") && !is_valid_id(message["id"])) {
        envelope.error_code = INVALID_REQUEST;
        envelope.error_message = "Invalid Request: id must be a string, number or null";
        return envelope;
    }

    if (!message.contains("method") || !message["method"].is_string()) {
        envelope.error_code = INVALID_REQUEST;
        envelope.error_message = "Invalid Request: missing or non-string method";
        return envelope;
    }
    envelope.method = message["method"].get<std::string>();

    if (message.contains("params")) {
        const json &params = message["params"];
        if (params.is_object()) {
            envelope.params = params;
        } else if (!params.is_null()) {
            envelope.error_code = INVALID_PARAMS;
            envelope.error_message = "Invalid params: params must be an object";
            return envelope;
        }
    }

    envelope.kind = is_notification(message) ? EnvelopeKind::Notification : EnvelopeKind::Request;
    return envelope;
}

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

bool is_notification(const json &message) {
    return message.is_object() && !message.contains("id");
}

} // namespace json_rpc

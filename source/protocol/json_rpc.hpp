#ifndef EDMCPS_JSON_RPC_HPP
#define EDMCPS_JSON_RPC_HPP

// JSON-RPC 2.0 envelopes for the MCP session.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;

// Server-defined: a method other than initialize arrived first.
constexpr int SERVER_NOT_INITIALIZED = -32002;

enum class EnvelopeKind {
    Request,       // has an id, expects exactly one response
    Notification,  // no id, never answered
    Invalid        // not a usable request; answer with error_code
};

// A classified incoming message.
struct Envelope {
    EnvelopeKind kind = EnvelopeKind::Invalid;
    json id;                 // echoed verbatim; null when absent or unusable
    std::string method;
    json params;             // always an object (empty when absent)
    int error_code = 0;      // set when kind == Invalid
    std::string error_message;
};

// Classifies a parsed message. Checks "jsonrpc": "2.0", a string method,
// an id that is a string, number or null, and object-or-absent params.
Envelope parse_envelope(const json &message);

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Check if a message is a notification (no id field).
bool is_notification(const json &message);

} // namespace json_rpc

#endif // EDMCPS_JSON_RPC_HPP

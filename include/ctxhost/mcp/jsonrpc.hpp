#pragma once
#include "ctxhost/types.hpp"

#include <optional>
#include <string>

namespace ctxhost::mcp::jsonrpc
{

constexpr const char* kVersion = "2.0";

constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
constexpr int kPromptNotFound = -32001;
constexpr int kResourceNotFound = -32002;

struct Request
{
    std::string method;
    Json params = Json::object();
    std::optional<Json> id; // absent for notifications

    bool is_notification() const
    {
        return !id.has_value();
    }

    /// params[key] if it is a non-empty string
    std::optional<std::string> string_param(const char* key) const;

    std::optional<std::string> capability_name() const
    {
        return string_param("name");
    }

    /// params.arguments, or nullopt when absent or null
    std::optional<Json> arguments() const;
};

struct ErrorObject
{
    int code{kInternalError};
    std::string message;
    std::optional<Json> data;
};

struct Response
{
    Json id;
    std::optional<Json> result;
    std::optional<ErrorObject> error;

    bool is_error() const
    {
        return error.has_value();
    }
};

/// Build a typed request from an already-parsed message.
/// @throws ValidationError if the message is not a JSON-RPC request object
Request decode_request(const Json& message);

/// Parse one line of input.
/// @throws ParseError on invalid JSON, ValidationError on a malformed envelope
Request decode_request(const std::string& line);

Response make_result(const Json& id, Json result);
Response make_error(const Json& id, int code, std::string message);

void to_json(Json& j, const ErrorObject& error);
void to_json(Json& j, const Response& response);

/// Serialize to a single line without trailing newline.
std::string encode_response(const Response& response);

} // namespace ctxhost::mcp::jsonrpc

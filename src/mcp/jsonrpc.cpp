#include "ctxhost/mcp/jsonrpc.hpp"

#include "ctxhost/exceptions.hpp"

namespace ctxhost::mcp::jsonrpc
{

std::optional<std::string> Request::string_param(const char* key) const
{
    if (!params.is_object())
        return std::nullopt;
    auto it = params.find(key);
    if (it == params.end() || !it->is_string())
        return std::nullopt;
    auto value = it->get<std::string>();
    if (value.empty())
        return std::nullopt;
    return value;
}

std::optional<Json> Request::arguments() const
{
    if (!params.is_object())
        return std::nullopt;
    auto it = params.find("arguments");
    if (it == params.end() || it->is_null())
        return std::nullopt;
    return *it;
}

Request decode_request(const Json& message)
{
    if (!message.is_object())
        throw ValidationError("request must be a JSON object");

    auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string())
        throw ValidationError("request is missing a string 'method'");

    Request request;
    request.method = method_it->get<std::string>();

    auto params_it = message.find("params");
    if (params_it != message.end() && !params_it->is_null())
    {
        if (!params_it->is_object() && !params_it->is_array())
            throw ValidationError("'params' must be an object or array");
        request.params = *params_it;
    }

    auto id_it = message.find("id");
    if (id_it != message.end())
    {
        if (!id_it->is_string() && !id_it->is_number_integer() && !id_it->is_null())
            throw ValidationError("'id' must be a string or integer");
        // A null id is still a request that expects a reply.
        request.id = *id_it;
    }
    return request;
}

Request decode_request(const std::string& line)
{
    Json message;
    try
    {
        message = Json::parse(line);
    }
    catch (const Json::parse_error& e)
    {
        throw ParseError(e.what());
    }
    return decode_request(message);
}

Response make_result(const Json& id, Json result)
{
    Response response;
    response.id = id;
    response.result = std::move(result);
    return response;
}

Response make_error(const Json& id, int code, std::string message)
{
    Response response;
    response.id = id;
    response.error = ErrorObject{code, std::move(message), std::nullopt};
    return response;
}

void to_json(Json& j, const ErrorObject& error)
{
    j = Json{{"code", error.code}, {"message", error.message}};
    if (error.data)
        j["data"] = *error.data;
}

void to_json(Json& j, const Response& response)
{
    j = Json{{"jsonrpc", kVersion}, {"id", response.id}};
    if (response.error)
        j["error"] = *response.error;
    else
        j["result"] = response.result ? *response.result : Json::object();
}

std::string encode_response(const Response& response)
{
    // dump() escapes control characters, so the output never spans lines.
    return Json(response).dump(-1, ' ', false, Json::error_handler_t::replace);
}

} // namespace ctxhost::mcp::jsonrpc

#include "ctxhost/mcp/dispatcher.hpp"

#include "ctxhost/exceptions.hpp"
#include "ctxhost/util/log.hpp"

#include <exception>
#include <vector>

namespace ctxhost::mcp
{

using jsonrpc::make_error;
using jsonrpc::make_result;
using jsonrpc::Request;
using jsonrpc::Response;

namespace
{
template <typename Descriptor>
Json descriptors_to_json(const std::vector<Descriptor>& descriptors)
{
    Json array = Json::array();
    for (const auto& descriptor : descriptors)
        array.push_back(Json(descriptor));
    return array;
}
} // namespace

Dispatcher::Dispatcher(server::Server server, std::shared_ptr<const ToolRegistry> tools,
                       std::shared_ptr<const PromptRegistry> prompts,
                       std::shared_ptr<const ResourceRegistry> resources)
    : server_(std::move(server)), tools_(std::move(tools)), prompts_(std::move(prompts)),
      resources_(std::move(resources))
{
    routes_["initialize"] = &Dispatcher::initialize;
    routes_["ping"] = &Dispatcher::ping;
    if (tools_)
    {
        routes_["tools/list"] = &Dispatcher::list_tools;
        routes_["tools/call"] = &Dispatcher::call_tool;
    }
    if (prompts_)
    {
        routes_["prompts/list"] = &Dispatcher::list_prompts;
        routes_["prompts/get"] = &Dispatcher::get_prompt;
    }
    if (resources_)
    {
        routes_["resources/list"] = &Dispatcher::list_resources;
        routes_["resources/read"] = &Dispatcher::read_resource;
    }
}

std::optional<Response> Dispatcher::handle(const Request& request) const
{
    if (request.is_notification())
    {
        handle_notification(request);
        return std::nullopt;
    }

    try
    {
        return route(request);
    }
    catch (const std::exception& e)
    {
        log::error("request '" + request.method + "' failed: " + e.what());
        return make_error(*request.id, jsonrpc::kInternalError, e.what());
    }
}

Response Dispatcher::route(const Request& request) const
{
    auto it = routes_.find(request.method);
    if (it == routes_.end())
        return make_error(*request.id, jsonrpc::kMethodNotFound,
                          "Method '" + request.method + "' not found");
    return (this->*(it->second))(request);
}

void Dispatcher::handle_notification(const Request& request) const
{
    if (request.method == "notifications/initialized")
        log::debug("client initialized");
    else if (request.method == "notifications/cancelled")
        log::debug("client cancelled a request; requests are handled synchronously");
    else
        log::debug("ignoring notification '" + request.method + "'");
}

Json Dispatcher::capabilities() const
{
    Json capabilities = Json::object();
    if (tools_)
        capabilities["tools"] = Json{{"listChanged", false}};
    if (prompts_)
        capabilities["prompts"] = Json{{"listChanged", false}};
    if (resources_)
        capabilities["resources"] = Json{{"subscribe", false}, {"listChanged", false}};
    return capabilities;
}

Response Dispatcher::initialize(const Request& request) const
{
    Json result = {{"protocolVersion", kProtocolVersion},
                   {"capabilities", capabilities()},
                   {"serverInfo", server_.server_info()}};
    if (server_.instructions())
        result["instructions"] = *server_.instructions();
    return make_result(*request.id, std::move(result));
}

Response Dispatcher::ping(const Request& request) const
{
    return make_result(*request.id, Json::object());
}

Response Dispatcher::list_tools(const Request& request) const
{
    return make_result(*request.id, Json{{"tools", descriptors_to_json(tools_->list())}});
}

Response Dispatcher::call_tool(const Request& request) const
{
    auto name = request.capability_name();
    if (!name)
        return make_error(*request.id, jsonrpc::kInvalidParams, "Missing tool name");

    auto entry = tools_->lookup(*name);
    if (!entry)
        return make_error(*request.id, jsonrpc::kInvalidParams, "Unknown tool: " + *name);

    // Tool failures are reported in-band so the client model can see them.
    try
    {
        Json content = Json::array();
        for (const auto& block : entry->executor->execute(request.arguments()))
            content.push_back(content_to_json(block));
        return make_result(*request.id, Json{{"content", content}});
    }
    catch (const std::exception& e)
    {
        log::warning("tool '" + *name + "' failed: " + e.what());
        Json content = Json::array({Json{{"type", "text"}, {"text", e.what()}}});
        return make_result(*request.id, Json{{"content", content}, {"isError", true}});
    }
}

Response Dispatcher::list_prompts(const Request& request) const
{
    return make_result(*request.id, Json{{"prompts", descriptors_to_json(prompts_->list())}});
}

Response Dispatcher::get_prompt(const Request& request) const
{
    auto name = request.capability_name();
    if (!name)
        return make_error(*request.id, jsonrpc::kInvalidParams, "Missing prompt name");

    auto entry = prompts_->lookup(*name);
    if (!entry)
        return make_error(*request.id, jsonrpc::kPromptNotFound, "Prompt not found: " + *name);

    try
    {
        return make_result(*request.id, Json(entry->executor->compute(request.arguments())));
    }
    catch (const std::exception& e)
    {
        log::warning("prompt '" + *name + "' failed: " + e.what());
        return make_error(*request.id, jsonrpc::kInternalError, e.what());
    }
}

Response Dispatcher::list_resources(const Request& request) const
{
    return make_result(*request.id,
                       Json{{"resources", descriptors_to_json(resources_->list())}});
}

Response Dispatcher::read_resource(const Request& request) const
{
    auto uri = request.string_param("uri");
    if (!uri)
        return make_error(*request.id, jsonrpc::kInvalidParams, "Missing resource URI");

    auto entry = resources_->lookup(*uri);
    if (!entry)
        return make_error(*request.id, jsonrpc::kResourceNotFound,
                          "Resource not found: " + *uri);

    try
    {
        Json contents = Json::array();
        for (const auto& item : entry->executor->read(request.arguments()))
            contents.push_back(Json(item));
        return make_result(*request.id, Json{{"contents", contents}});
    }
    catch (const std::exception& e)
    {
        log::warning("resource '" + *uri + "' failed: " + e.what());
        return make_error(*request.id, jsonrpc::kInternalError, e.what());
    }
}

Dispatcher DispatcherBuilder::build() const
{
    if (!name_ || !version_ || name_->empty())
        throw ValidationError("server info is required to build a dispatcher");

    server::Server server(*name_, *version_, instructions_);
    return Dispatcher(std::move(server), tools_, prompts_, resources_);
}

} // namespace ctxhost::mcp

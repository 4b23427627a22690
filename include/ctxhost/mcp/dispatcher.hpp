#pragma once
#include "ctxhost/mcp/jsonrpc.hpp"
#include "ctxhost/registry.hpp"
#include "ctxhost/server/server.hpp"
#include "ctxhost/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace ctxhost::mcp
{

constexpr const char* kProtocolVersion = "2024-11-05";

/**
 * Routes decoded JSON-RPC requests to the capability registries.
 *
 * Supported methods:
 * - "initialize", "ping"
 * - "tools/list", "tools/call"          (when a ToolRegistry is attached)
 * - "prompts/list", "prompts/get"       (when a PromptRegistry is attached)
 * - "resources/list", "resources/read"  (when a ResourceRegistry is attached)
 *
 * A Dispatcher is immutable once built and handle() may be called concurrently.
 * Registries are shared, not owned; capabilities can still be registered on them
 * while the dispatcher is serving.
 */
class Dispatcher
{
  public:
    Dispatcher(server::Server server, std::shared_ptr<const ToolRegistry> tools,
               std::shared_ptr<const PromptRegistry> prompts,
               std::shared_ptr<const ResourceRegistry> resources);

    /// Handle one request. Returns std::nullopt for notifications, which never get a reply.
    std::optional<jsonrpc::Response> handle(const jsonrpc::Request& request) const;

    /// Capabilities object advertised by initialize.
    Json capabilities() const;

    const server::Server& server() const
    {
        return server_;
    }

  private:
    using Route = jsonrpc::Response (Dispatcher::*)(const jsonrpc::Request&) const;

    jsonrpc::Response route(const jsonrpc::Request& request) const;
    void handle_notification(const jsonrpc::Request& request) const;

    jsonrpc::Response initialize(const jsonrpc::Request& request) const;
    jsonrpc::Response ping(const jsonrpc::Request& request) const;
    jsonrpc::Response list_tools(const jsonrpc::Request& request) const;
    jsonrpc::Response call_tool(const jsonrpc::Request& request) const;
    jsonrpc::Response list_prompts(const jsonrpc::Request& request) const;
    jsonrpc::Response get_prompt(const jsonrpc::Request& request) const;
    jsonrpc::Response list_resources(const jsonrpc::Request& request) const;
    jsonrpc::Response read_resource(const jsonrpc::Request& request) const;

    server::Server server_;
    std::shared_ptr<const ToolRegistry> tools_;
    std::shared_ptr<const PromptRegistry> prompts_;
    std::shared_ptr<const ResourceRegistry> resources_;
    std::unordered_map<std::string, Route> routes_;
};

/// Assembles a Dispatcher. Server identity is mandatory; each registry is optional and
/// only attached kinds are advertised and routed.
class DispatcherBuilder
{
  public:
    DispatcherBuilder& with_server_info(std::string name, std::string version)
    {
        name_ = std::move(name);
        version_ = std::move(version);
        return *this;
    }
    DispatcherBuilder& with_instructions(std::string instructions)
    {
        instructions_ = std::move(instructions);
        return *this;
    }
    DispatcherBuilder& with_tools(std::shared_ptr<const ToolRegistry> tools)
    {
        tools_ = std::move(tools);
        return *this;
    }
    DispatcherBuilder& with_prompts(std::shared_ptr<const PromptRegistry> prompts)
    {
        prompts_ = std::move(prompts);
        return *this;
    }
    DispatcherBuilder& with_resources(std::shared_ptr<const ResourceRegistry> resources)
    {
        resources_ = std::move(resources);
        return *this;
    }

    /// @throws ValidationError if no server info was provided
    Dispatcher build() const;

  private:
    std::optional<std::string> name_;
    std::optional<std::string> version_;
    std::optional<std::string> instructions_;
    std::shared_ptr<const ToolRegistry> tools_;
    std::shared_ptr<const PromptRegistry> prompts_;
    std::shared_ptr<const ResourceRegistry> resources_;
};

} // namespace ctxhost::mcp

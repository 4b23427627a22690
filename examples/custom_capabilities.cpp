#include <ctxhost.hpp>

#include <memory>
#include <string>

// Example: registering your own tool, prompt and resource
//
// Usage:
//   ./ctxhost_example_custom_capabilities
//
// Then send JSON-RPC requests via stdin, for example:
//   {"jsonrpc":"2.0","id":1,"method":"initialize","params":{}}
//   {"jsonrpc":"2.0","id":2,"method":"tools/list"}
//   {"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"add","arguments":{"a":5,"b":7}}}
//   {"jsonrpc":"2.0","id":4,"method":"prompts/get","params":{"name":"review","arguments":{"topic":"locks"}}}
//   {"jsonrpc":"2.0","id":5,"method":"resources/read","params":{"uri":"memo://readme"}}
//
// Press Ctrl+D (Unix) or Ctrl+Z (Windows) to send EOF and terminate.

namespace
{

class AddTool : public ctxhost::tools::ToolExecutor
{
  public:
    std::vector<ctxhost::ContentBlock>
    execute(const std::optional<ctxhost::Json>& arguments) const override
    {
        if (!arguments || !arguments->contains("a") || !arguments->contains("b"))
            throw ctxhost::InvocationError("expected numeric arguments 'a' and 'b'");
        double sum = arguments->at("a").get<double>() + arguments->at("b").get<double>();
        return {ctxhost::TextContent{std::to_string(sum)}};
    }

    ctxhost::tools::Tool to_tool() const override
    {
        using ctxhost::Json;
        return ctxhost::tools::Tool{
            "add", std::string("Add two numbers"),
            Json{{"type", "object"},
                 {"properties", Json{{"a", Json{{"type", "number"}}}, {"b", Json{{"type", "number"}}}}},
                 {"required", Json::array({"a", "b"})}}};
    }
};

} // namespace

int main()
{
    using namespace ctxhost;

    auto tool_registry = std::make_shared<ToolRegistry>();
    tool_registry->register_capability(std::make_shared<AddTool>());

    auto prompt_registry = std::make_shared<PromptRegistry>();
    prompt_registry->register_capability(std::make_shared<prompts::FunctionPrompt>(
        prompts::Prompt{"review",
                        std::string("Ask for a code review on a topic"),
                        {prompts::PromptArgument{"topic", std::nullopt, true}}},
        [](const std::optional<Json>& args)
        {
            if (!args || !args->contains("topic"))
                throw InvocationError("missing argument: topic");
            prompts::ComputedPrompt out;
            out.description = "Code review request";
            out.messages.push_back(prompts::PromptMessage{
                prompts::PromptRole::User,
                TextContent{"Please review my use of " + args->at("topic").get<std::string>()}});
            return out;
        }));

    auto resource_registry = std::make_shared<ResourceRegistry>();
    resource_registry->register_capability(std::make_shared<resources::FunctionResource>(
        resources::Resource{"memo://readme", "readme", std::nullopt, std::string("text/plain")},
        [](const std::optional<Json>&)
        {
            return std::vector<ResourceContents>{ResourceContents{
                "memo://readme", std::string("text/plain"), std::string("Hello from ctxhost")}};
        }));

    auto dispatcher = mcp::DispatcherBuilder()
                          .with_server_info("custom_capabilities", "0.1.0")
                          .with_tools(tool_registry)
                          .with_prompts(prompt_registry)
                          .with_resources(resource_registry)
                          .build();

    server::StdioServer server([&dispatcher](const mcp::jsonrpc::Request& request)
                               { return dispatcher.handle(request); });
    try
    {
        server.run();
    }
    catch (const TransportError& e)
    {
        log::error(e.what());
        return 1;
    }
    return 0;
}

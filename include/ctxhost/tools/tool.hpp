#pragma once
#include "ctxhost/content.hpp"
#include "ctxhost/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ctxhost::tools
{

/// MCP Tool descriptor, as advertised by tools/list
struct Tool
{
    std::string name;
    std::optional<std::string> description;
    Json input_schema = Json::object();
};

void to_json(Json& j, const Tool& tool);

inline const std::string& registry_key(const Tool& tool)
{
    return tool.name;
}

/// Behavior behind a registered tool.
///
/// Implementations interpret their own arguments and report failures by throwing;
/// the dispatcher turns a throw into an error result for the caller.
class ToolExecutor
{
  public:
    using Descriptor = Tool;
    static constexpr Kind kind = Kind::Tool;

    virtual ~ToolExecutor() = default;

    virtual std::vector<ContentBlock> execute(const std::optional<Json>& arguments) const = 0;
    virtual Tool to_tool() const = 0;

    Tool describe() const
    {
        return to_tool();
    }
};

/// Adapter so a tool can be registered from a descriptor and a callable.
class FunctionTool : public ToolExecutor
{
  public:
    using Fn = std::function<std::vector<ContentBlock>(const std::optional<Json>&)>;

    FunctionTool(Tool tool, Fn fn) : tool_(std::move(tool)), fn_(std::move(fn)) {}

    std::vector<ContentBlock> execute(const std::optional<Json>& arguments) const override
    {
        return fn_(arguments);
    }

    Tool to_tool() const override
    {
        return tool_;
    }

  private:
    Tool tool_;
    Fn fn_;
};

} // namespace ctxhost::tools

#pragma once
#include "ctxhost/prompts/prompt.hpp"
#include "ctxhost/tools/tool.hpp"

#include <chrono>
#include <string>

namespace ctxhost::capabilities
{

/// Three-line summary of local time, ISO week number and weekday name.
std::string time_info(std::chrono::system_clock::time_point when);
std::string current_time_info();

/// "now" tool: takes no arguments, returns time_info() as a text block.
class NowTool : public tools::ToolExecutor
{
  public:
    std::vector<ContentBlock> execute(const std::optional<Json>& arguments) const override;
    tools::Tool to_tool() const override;
};

/// "Now" prompt: a single user message carrying time_info().
class NowPrompt : public prompts::PromptExecutor
{
  public:
    prompts::ComputedPrompt compute(const std::optional<Json>& arguments) const override;
    prompts::Prompt to_prompt() const override;
};

} // namespace ctxhost::capabilities

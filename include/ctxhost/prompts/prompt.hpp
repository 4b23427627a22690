#pragma once
#include "ctxhost/content.hpp"
#include "ctxhost/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ctxhost::prompts
{

/// MCP Prompt argument definition
struct PromptArgument
{
    std::string name;
    std::optional<std::string> description;
    bool required{false};
};

/// MCP Prompt definition, as advertised by prompts/list
struct Prompt
{
    std::string name;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;
};

enum class PromptRole
{
    User,
    Assistant
};

std::string to_string(PromptRole role);

/// MCP Prompt message
struct PromptMessage
{
    PromptRole role{PromptRole::User};
    ContentBlock content;
};

/// Result of prompts/get
struct ComputedPrompt
{
    std::string description;
    std::vector<PromptMessage> messages;
};

void to_json(Json& j, const PromptArgument& arg);
void to_json(Json& j, const Prompt& prompt);
void to_json(Json& j, const PromptMessage& message);
void to_json(Json& j, const ComputedPrompt& computed);

inline const std::string& registry_key(const Prompt& prompt)
{
    return prompt.name;
}

class PromptExecutor
{
  public:
    using Descriptor = Prompt;
    static constexpr Kind kind = Kind::Prompt;

    virtual ~PromptExecutor() = default;

    virtual ComputedPrompt compute(const std::optional<Json>& arguments) const = 0;
    virtual Prompt to_prompt() const = 0;

    Prompt describe() const
    {
        return to_prompt();
    }
};

class FunctionPrompt : public PromptExecutor
{
  public:
    using Fn = std::function<ComputedPrompt(const std::optional<Json>&)>;

    FunctionPrompt(Prompt prompt, Fn fn) : prompt_(std::move(prompt)), fn_(std::move(fn)) {}

    ComputedPrompt compute(const std::optional<Json>& arguments) const override
    {
        return fn_(arguments);
    }

    Prompt to_prompt() const override
    {
        return prompt_;
    }

  private:
    Prompt prompt_;
    Fn fn_;
};

} // namespace ctxhost::prompts

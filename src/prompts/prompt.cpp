#include "ctxhost/prompts/prompt.hpp"

namespace ctxhost::prompts
{

std::string to_string(PromptRole role)
{
    switch (role)
    {
    case PromptRole::User:
        return "user";
    case PromptRole::Assistant:
        return "assistant";
    }
    return "user";
}

void to_json(Json& j, const PromptArgument& arg)
{
    j = Json{{"name", arg.name}, {"required", arg.required}};
    if (arg.description)
        j["description"] = *arg.description;
}

void to_json(Json& j, const Prompt& prompt)
{
    j = Json{{"name", prompt.name}};
    if (prompt.description)
        j["description"] = *prompt.description;
    if (!prompt.arguments.empty())
    {
        Json args_array = Json::array();
        for (const auto& arg : prompt.arguments)
            args_array.push_back(Json(arg));
        j["arguments"] = args_array;
    }
}

void to_json(Json& j, const PromptMessage& message)
{
    j = Json{{"role", to_string(message.role)}, {"content", content_to_json(message.content)}};
}

void to_json(Json& j, const ComputedPrompt& computed)
{
    Json messages_array = Json::array();
    for (const auto& msg : computed.messages)
        messages_array.push_back(Json(msg));
    j = Json{{"description", computed.description}, {"messages", messages_array}};
}

} // namespace ctxhost::prompts

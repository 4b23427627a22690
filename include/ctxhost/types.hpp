#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace ctxhost
{

using Json = nlohmann::json;

/// Capability kinds a context server can expose.
enum class Kind
{
    Tool,
    Prompt,
    Resource
};

inline std::string to_string(Kind kind)
{
    switch (kind)
    {
    case Kind::Tool:
        return "tool";
    case Kind::Prompt:
        return "prompt";
    case Kind::Resource:
        return "resource";
    }
    return "tool";
}

/// Policy applied when a registry already holds an entry under the same key.
enum class DuplicateBehavior
{
    Error,
    Warn,
    Replace,
    Ignore
};

inline std::string to_string(DuplicateBehavior behavior)
{
    switch (behavior)
    {
    case DuplicateBehavior::Error:
        return "error";
    case DuplicateBehavior::Warn:
        return "warn";
    case DuplicateBehavior::Replace:
        return "replace";
    case DuplicateBehavior::Ignore:
        return "ignore";
    }
    return "error";
}

} // namespace ctxhost

#include "ctxhost/settings.hpp"

#include "ctxhost/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace ctxhost
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static std::string to_upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

static std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Settings Settings::from_env()
{
    Settings s;
    s.log_level = to_upper(getenv_str("CTXHOST_LOG_LEVEL", s.log_level));
    s.on_duplicate = to_lower(getenv_str("CTXHOST_ON_DUPLICATE", s.on_duplicate));
    return s;
}

Settings Settings::from_json(const Json& j)
{
    return Settings{}.merged_with(j);
}

Settings Settings::merged_with(const Json& j) const
{
    if (!j.is_object())
        throw ValidationError("settings must be a JSON object");

    Settings s = *this;
    try
    {
        if (j.contains("log_level"))
            s.log_level = j.at("log_level").get<std::string>();
        if (j.contains("on_duplicate"))
            s.on_duplicate = to_lower(j.at("on_duplicate").get<std::string>());
    }
    catch (const Json::type_error& e)
    {
        throw ValidationError(std::string("invalid settings: ") + e.what());
    }
    return s;
}

Settings Settings::from_file(const std::string& path)
{
    return from_file(path, Settings{});
}

Settings Settings::from_file(const std::string& path, const Settings& base)
{
    std::ifstream in(path);
    if (!in)
        throw ValidationError("cannot open settings file: " + path);

    Json j;
    try
    {
        j = Json::parse(in);
    }
    catch (const Json::parse_error& e)
    {
        throw ValidationError("invalid settings file " + path + ": " + e.what());
    }
    return base.merged_with(j);
}

DuplicateBehavior Settings::duplicate_behavior() const
{
    const auto policy = to_lower(on_duplicate);
    if (policy == "error")
        return DuplicateBehavior::Error;
    if (policy == "warn")
        return DuplicateBehavior::Warn;
    if (policy == "replace")
        return DuplicateBehavior::Replace;
    if (policy == "ignore")
        return DuplicateBehavior::Ignore;
    throw ValidationError("unknown duplicate policy '" + on_duplicate + "' (expected " +
                          to_string(DuplicateBehavior::Error) + ", " +
                          to_string(DuplicateBehavior::Warn) + ", " +
                          to_string(DuplicateBehavior::Replace) + " or " +
                          to_string(DuplicateBehavior::Ignore) + ")");
}

} // namespace ctxhost

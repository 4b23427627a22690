#pragma once
#include "ctxhost/types.hpp"

#include <string>

namespace ctxhost
{

struct Settings
{
    std::string log_level{"INFO"};
    std::string on_duplicate{"error"};

    /// Reads CTXHOST_LOG_LEVEL and CTXHOST_ON_DUPLICATE.
    static Settings from_env();
    static Settings from_json(const Json& j);
    /// @throws ValidationError if the file cannot be read or is not a JSON object
    static Settings from_file(const std::string& path);
    /// Values in the file override base.
    static Settings from_file(const std::string& path, const Settings& base);

    /// Values present in j override this instance.
    Settings merged_with(const Json& j) const;

    /// @throws ValidationError for an unknown policy name
    DuplicateBehavior duplicate_behavior() const;
};

} // namespace ctxhost

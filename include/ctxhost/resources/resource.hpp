#pragma once
#include "ctxhost/content.hpp"
#include "ctxhost/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ctxhost::resources
{

/// MCP Resource definition, as advertised by resources/list
struct Resource
{
    std::string uri;                        // e.g., "file://readme.txt"
    std::string name;                       // Human-readable name
    std::optional<std::string> description; // Optional description
    std::optional<std::string> mime_type;   // MIME type hint
};

void to_json(Json& j, const Resource& resource);

// Resources are addressed by URI rather than by display name.
inline const std::string& registry_key(const Resource& resource)
{
    return resource.uri;
}

class ResourceExecutor
{
  public:
    using Descriptor = Resource;
    static constexpr Kind kind = Kind::Resource;

    virtual ~ResourceExecutor() = default;

    virtual std::vector<ResourceContents> read(const std::optional<Json>& arguments) const = 0;
    virtual Resource to_resource() const = 0;

    Resource describe() const
    {
        return to_resource();
    }
};

class FunctionResource : public ResourceExecutor
{
  public:
    using Fn = std::function<std::vector<ResourceContents>(const std::optional<Json>&)>;

    FunctionResource(Resource resource, Fn fn)
        : resource_(std::move(resource)), fn_(std::move(fn))
    {
    }

    std::vector<ResourceContents> read(const std::optional<Json>& arguments) const override
    {
        return fn_(arguments);
    }

    Resource to_resource() const override
    {
        return resource_;
    }

  private:
    Resource resource_;
    Fn fn_;
};

} // namespace ctxhost::resources

#include "ctxhost/resources/resource.hpp"

namespace ctxhost::resources
{

void to_json(Json& j, const Resource& resource)
{
    j = Json{{"uri", resource.uri}, {"name", resource.name}};
    if (resource.description)
        j["description"] = *resource.description;
    if (resource.mime_type)
        j["mimeType"] = *resource.mime_type;
}

} // namespace ctxhost::resources

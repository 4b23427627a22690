#include "ctxhost/tools/tool.hpp"

namespace ctxhost::tools
{

void to_json(Json& j, const Tool& tool)
{
    j = Json{{"name", tool.name}};
    if (tool.description)
        j["description"] = *tool.description;
    // Schema may be empty
    if (!tool.input_schema.is_null() && !tool.input_schema.empty())
        j["inputSchema"] = tool.input_schema;
    else
        j["inputSchema"] = Json{{"type", "object"}};
}

} // namespace ctxhost::tools

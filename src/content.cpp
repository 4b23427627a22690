#include "ctxhost/content.hpp"

namespace ctxhost
{

std::string base64_encode(const std::vector<std::uint8_t>& bytes)
{
    static const char* b64_chars =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string b64;
    b64.reserve((bytes.size() + 2) / 3 * 4);
    for (size_t i = 0; i < bytes.size(); i += 3)
    {
        uint32_t n = static_cast<uint32_t>(bytes[i]) << 16;
        if (i + 1 < bytes.size())
            n |= static_cast<uint32_t>(bytes[i + 1]) << 8;
        if (i + 2 < bytes.size())
            n |= bytes[i + 2];
        b64.push_back(b64_chars[(n >> 18) & 0x3F]);
        b64.push_back(b64_chars[(n >> 12) & 0x3F]);
        b64.push_back((i + 1 < bytes.size()) ? b64_chars[(n >> 6) & 0x3F] : '=');
        b64.push_back((i + 2 < bytes.size()) ? b64_chars[n & 0x3F] : '=');
    }
    return b64;
}

void to_json(Json& j, const ResourceContents& c)
{
    j = Json{{"uri", c.uri}};
    if (c.mime_type)
        j["mimeType"] = *c.mime_type;
    if (std::holds_alternative<std::string>(c.data))
        j["text"] = std::get<std::string>(c.data);
    else
        j["blob"] = base64_encode(std::get<std::vector<std::uint8_t>>(c.data));
}

void to_json(Json& j, const TextContent& c)
{
    j = Json{{"type", "text"}, {"text", c.text}};
}

void to_json(Json& j, const ImageContent& c)
{
    j = Json{{"type", "image"}, {"data", c.data}, {"mimeType", c.mime_type}};
}

void to_json(Json& j, const EmbeddedResource& c)
{
    j = Json{{"type", "resource"}, {"resource", c.resource}};
}

Json content_to_json(const ContentBlock& block)
{
    return std::visit([](const auto& content) { return Json(content); }, block);
}

} // namespace ctxhost

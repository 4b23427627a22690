#pragma once
#include "ctxhost/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ctxhost
{

/// Contents of a resource: either UTF-8 text or raw bytes (sent as base64 "blob").
struct ResourceContents
{
    std::string uri;
    std::optional<std::string> mime_type;
    std::variant<std::string, std::vector<std::uint8_t>> data;
};

struct TextContent
{
    std::string text;
};

struct ImageContent
{
    std::string data;      // base64-encoded image bytes
    std::string mime_type; // e.g., "image/png"
};

struct EmbeddedResource
{
    ResourceContents resource;
};

/// A single block of content in a tool result or prompt message.
using ContentBlock = std::variant<TextContent, ImageContent, EmbeddedResource>;

std::string base64_encode(const std::vector<std::uint8_t>& bytes);

// nlohmann::json adapters
void to_json(Json& j, const ResourceContents& c);
void to_json(Json& j, const TextContent& c);
void to_json(Json& j, const ImageContent& c);
void to_json(Json& j, const EmbeddedResource& c);
Json content_to_json(const ContentBlock& block);

} // namespace ctxhost

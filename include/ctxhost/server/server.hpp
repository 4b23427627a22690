#pragma once
#include "ctxhost/types.hpp"
#include "ctxhost/version.hpp"

#include <optional>
#include <string>

namespace ctxhost::server
{

/// Server identity advertised in the MCP initialize response:
/// - name: Server name (required)
/// - version: Server version
/// - instructions: Optional instructions shown during initialize
class Server
{
  public:
    explicit Server(std::string name = ctxhost::NAME, std::string version = ctxhost::VERSION,
                    std::optional<std::string> instructions = std::nullopt)
        : name_(std::move(name)), version_(std::move(version)),
          instructions_(std::move(instructions))
    {
    }

    const std::string& name() const
    {
        return name_;
    }
    const std::string& version() const
    {
        return version_;
    }
    const std::optional<std::string>& instructions() const
    {
        return instructions_;
    }

    Json server_info() const
    {
        return Json{{"name", name_}, {"version", version_}};
    }

  private:
    std::string name_;
    std::string version_;
    std::optional<std::string> instructions_;
};

} // namespace ctxhost::server

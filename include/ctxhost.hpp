#pragma once

/// @file ctxhost.hpp
/// @brief Main header for ctxhost - includes the capability and dispatch components
///
/// Usage:
/// @code
/// #include <ctxhost.hpp>
///
/// int main() {
///     auto tools = std::make_shared<ctxhost::ToolRegistry>();
///     tools->register_capability(std::make_shared<MyTool>());
///
///     auto dispatcher = ctxhost::mcp::DispatcherBuilder()
///                           .with_server_info("my-server", "1.0.0")
///                           .with_tools(tools)
///                           .build();
///
///     ctxhost::server::StdioServer server(
///         [&](const auto& request) { return dispatcher.handle(request); });
///     server.run();
/// }
/// @endcode

// Core types and exceptions
#include "ctxhost/types.hpp"
#include "ctxhost/exceptions.hpp"
#include "ctxhost/content.hpp"
#include "ctxhost/settings.hpp"
#include "ctxhost/version.hpp"
#include "ctxhost/util/log.hpp"

// Capabilities
#include "ctxhost/tools/tool.hpp"
#include "ctxhost/prompts/prompt.hpp"
#include "ctxhost/resources/resource.hpp"
#include "ctxhost/registry.hpp"

// Protocol and transport
#include "ctxhost/mcp/jsonrpc.hpp"
#include "ctxhost/mcp/dispatcher.hpp"
#include "ctxhost/server/server.hpp"
#include "ctxhost/server/stdio_server.hpp"

/// @file tests/main_header/compile_test.cpp
/// @brief Compile test for main ctxhost.hpp header
///
/// This test verifies that including just <ctxhost.hpp> gives access to
/// registries, the dispatcher and the stdio transport.

#include "ctxhost.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>

using namespace ctxhost;

int main()
{
    std::cout << "=== Main Header Compile Test ===" << std::endl;

    std::cout << "test_version_metadata..." << std::endl;
    {
        assert(std::string(NAME) == "ctxhost");
        assert(std::string(VERSION).find('.') != std::string::npos);
        server::Server identity;
        assert(identity.name() == NAME);
        assert(identity.version() == VERSION);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_types_accessible..." << std::endl;
    {
        auto tools = std::make_shared<ToolRegistry>();
        auto dispatcher = mcp::DispatcherBuilder()
                              .with_server_info("header_test", "1.0.0")
                              .with_tools(tools)
                              .build();
        server::StdioServer stdio([&](const mcp::jsonrpc::Request& request)
                                  { return dispatcher.handle(request); });
        assert(!stdio.running());
        (void)sizeof(Settings);
        (void)sizeof(ResourceContents);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "\n=== All main header tests PASSED ===" << std::endl;
    return 0;
}

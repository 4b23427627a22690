#include "ctxhost/capabilities/now.hpp"
#include "ctxhost/cli/run_guarded.hpp"
#include "ctxhost/mcp/dispatcher.hpp"
#include "ctxhost/registry.hpp"
#include "ctxhost/server/stdio_server.hpp"
#include "ctxhost/settings.hpp"
#include "ctxhost/util/log.hpp"
#include "ctxhost/version.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace
{

static int usage(std::ostream& os, int exit_code = 1)
{
    os << ctxhost::NAME << " " << ctxhost::VERSION << "\n";
    os << "Usage:\n";
    os << "  " << ctxhost::NAME << " [--config <file>]   Serve MCP over stdin/stdout\n";
    os << "  " << ctxhost::NAME << " --version\n";
    os << "  " << ctxhost::NAME << " --help\n";
    os << "\n";
    os << "Environment:\n";
    os << "  CTXHOST_LOG_LEVEL      DEBUG, INFO, WARNING or ERROR (default INFO)\n";
    os << "  CTXHOST_ON_DUPLICATE   error, warn, replace or ignore (default error)\n";
    return exit_code;
}

static ctxhost::mcp::Dispatcher build_dispatcher(const ctxhost::Settings& settings)
{
    using namespace ctxhost;

    const auto on_duplicate = settings.duplicate_behavior();

    auto resources = std::make_shared<ResourceRegistry>(on_duplicate);

    auto tools = std::make_shared<ToolRegistry>(on_duplicate);
    tools->register_capability(std::make_shared<capabilities::NowTool>());

    auto prompts = std::make_shared<PromptRegistry>(on_duplicate);
    prompts->register_capability(std::make_shared<capabilities::NowPrompt>());

    return mcp::DispatcherBuilder()
        .with_server_info(NAME, VERSION)
        .with_resources(resources)
        .with_tools(tools)
        .with_prompts(prompts)
        .build();
}

} // namespace

int main(int argc, char** argv)
{
    using namespace ctxhost;

    std::optional<std::string> config_path;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
            return usage(std::cout, 0);
        if (arg == "--version" || arg == "-V")
        {
            std::cout << NAME << " " << VERSION << "\n";
            return 0;
        }
        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
            continue;
        }
        std::cerr << "Unknown option: " << arg << "\n";
        return usage(std::cerr);
    }

    return cli::run_guarded(
        [&config_path]
        {
            auto settings = Settings::from_env();
            if (config_path)
                settings = Settings::from_file(*config_path, settings);
            log::set_level(log::log_level_from_string(settings.log_level));

            // All registration happens here, before the first request is read.
            const auto dispatcher = build_dispatcher(settings);
            log::info("serving " + dispatcher.server().name() + " " +
                      dispatcher.server().version() + " on stdio");
            log::debug("duplicate policy: " + to_string(settings.duplicate_behavior()));

            server::StdioServer server([&dispatcher](const mcp::jsonrpc::Request& request)
                                       { return dispatcher.handle(request); });
            server.run();
            log::debug("input closed, exiting");
            return 0;
        });
}

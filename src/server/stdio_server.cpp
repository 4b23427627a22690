#include "ctxhost/server/stdio_server.hpp"

#include "ctxhost/exceptions.hpp"
#include "ctxhost/util/log.hpp"

#include <exception>
#include <iostream>
#include <string>

namespace ctxhost::server
{

namespace
{
// Clears both flags on every exit path, including a thrown TransportError.
struct RunningGuard
{
    std::atomic<bool>& running;
    std::atomic<bool>& stop_requested;
    ~RunningGuard()
    {
        stop_requested = false;
        running = false;
    }
};
} // namespace

StdioServer::StdioServer(Handler handler) : handler_(std::move(handler)) {}

void StdioServer::run()
{
    run(std::cin, std::cout);
}

void StdioServer::run(std::istream& in, std::ostream& out)
{
    if (running_.exchange(true))
        throw TransportError("server is already running");
    RunningGuard guard{running_, stop_requested_};

    std::string line;
    while (!stop_requested_ && std::getline(in, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        // Skip empty lines
        if (line.empty())
            continue;

        auto response = process_line(line);
        if (!response)
            continue;

        // Write JSON-RPC response to the output (line-delimited)
        out << mcp::jsonrpc::encode_response(*response) << '\n';
        out.flush();
        if (!out)
            throw TransportError("failed to write response to output");
    }

    if (in.bad())
        throw TransportError("failed to read from input");
}

std::optional<mcp::jsonrpc::Response> StdioServer::process_line(const std::string& line) const
{
    mcp::jsonrpc::Request request;
    try
    {
        request = mcp::jsonrpc::decode_request(line);
    }
    catch (const Error& e)
    {
        log::error(std::string("skipping malformed request: ") + e.what());
        return std::nullopt;
    }

    log::debug("request " + request.method);
    try
    {
        return handler_(request);
    }
    catch (const std::exception& e)
    {
        // Internal error → -32603
        log::error("request '" + request.method + "' failed: " + e.what());
        if (request.is_notification())
            return std::nullopt;
        return mcp::jsonrpc::make_error(*request.id, mcp::jsonrpc::kInternalError, e.what());
    }
}

} // namespace ctxhost::server

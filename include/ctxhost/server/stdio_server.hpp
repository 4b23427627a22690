#pragma once
#include "ctxhost/mcp/jsonrpc.hpp"

#include <atomic>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>

namespace ctxhost::server
{

/**
 * STDIO-based transport for line-delimited JSON-RPC communication.
 *
 * Reads one request per line, hands it to the handler and writes the response (if
 * any) as one line, flushing after each. Requests are processed strictly in order, so
 * responses come back in request order.
 *
 * Usage:
 *   auto dispatcher = ctxhost::mcp::DispatcherBuilder()...build();
 *   StdioServer server([&](const auto& req) { return dispatcher.handle(req); });
 *   server.run();  // Blocking - runs until EOF or stop() is called
 *
 * Lines that cannot be decoded are logged and skipped. A failure to read input or
 * write output is fatal and surfaces as TransportError.
 */
class StdioServer
{
  public:
    using Handler =
        std::function<std::optional<mcp::jsonrpc::Response>(const mcp::jsonrpc::Request&)>;

    explicit StdioServer(Handler handler);

    /// Serve std::cin / std::cout.
    void run();

    /// Serve arbitrary streams. Returns at EOF or after stop().
    /// @throws TransportError if the input goes bad or the output cannot be written
    void run(std::istream& in, std::ostream& out);

    /// Request the loop to exit after the current line. A stop requested before
    /// run() starts makes the next run() return without reading; the request is
    /// consumed when that run() returns.
    void stop()
    {
        stop_requested_ = true;
    }

    bool running() const
    {
        return running_.load();
    }

  private:
    std::optional<mcp::jsonrpc::Response> process_line(const std::string& line) const;

    Handler handler_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

} // namespace ctxhost::server

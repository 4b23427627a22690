#include "ctxhost/capabilities/now.hpp"
#include "ctxhost/exceptions.hpp"
#include "ctxhost/mcp/dispatcher.hpp"
#include "ctxhost/server/stdio_server.hpp"
#include "ctxhost/tools/tool.hpp"
#include "ctxhost/util/log.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// Drive the STDIO loop with string streams in place of stdin/stdout

using namespace ctxhost;

namespace
{
std::vector<Json> read_lines(const std::string& output)
{
    std::vector<Json> lines;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line))
        lines.push_back(Json::parse(line));
    return lines;
}

struct LogCapture
{
    std::vector<std::pair<log::LogLevel, std::string>> entries;

    LogCapture()
    {
        log::set_sink([this](log::LogLevel level, const std::string& message)
                      { entries.emplace_back(level, message); });
    }
    ~LogCapture()
    {
        log::reset_sink();
    }

    size_t count(log::LogLevel level) const
    {
        size_t n = 0;
        for (const auto& entry : entries)
            if (entry.first == level)
                ++n;
        return n;
    }
};
} // namespace

int main()
{
    auto tools = std::make_shared<ToolRegistry>();
    tools->register_capability(std::make_shared<capabilities::NowTool>());
    auto dispatcher = mcp::DispatcherBuilder()
                          .with_server_info("stdio_test", "1.0.0")
                          .with_tools(tools)
                          .with_prompts(std::make_shared<PromptRegistry>())
                          .build();
    auto handler = [&dispatcher](const mcp::jsonrpc::Request& request)
    { return dispatcher.handle(request); };

    // Test 1: malformed line followed by a valid request
    {
        LogCapture logs;
        server::StdioServer server(handler);
        std::istringstream in("{this is not json\n"
                              R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"now"}})"
                              "\n");
        std::ostringstream out;
        server.run(in, out);

        auto lines = read_lines(out.str());
        assert(lines.size() == 1);
        assert(lines[0]["id"] == 1);
        assert(!lines[0]["result"]["content"][0]["text"].get<std::string>().empty());
        assert(logs.count(log::LogLevel::Error) == 1);
        assert(!server.running());

        // The server keeps serving afterwards
        std::istringstream more(R"({"jsonrpc":"2.0","id":2,"method":"ping"})"
                                "\n");
        std::ostringstream more_out;
        server.run(more, more_out);
        assert(read_lines(more_out.str()).size() == 1);
        std::cout << "[PASS] Test 1: malformed line is skipped\n";
    }

    // Test 2: notifications produce no output, blank and CRLF lines are tolerated
    {
        server::StdioServer server(handler);
        std::istringstream in("\n"
                              R"({"jsonrpc":"2.0","method":"notifications/initialized"})"
                              "\r\n"
                              "\n"
                              R"({"jsonrpc":"2.0","id":"x","method":"ping"})"
                              "\r\n");
        std::ostringstream out;
        server.run(in, out);
        auto lines = read_lines(out.str());
        assert(lines.size() == 1);
        assert(lines[0]["id"] == "x");
        assert(lines[0]["result"].empty());
        std::cout << "[PASS] Test 2: notifications are silent\n";
    }

    // Test 3: responses come back in request order
    {
        server::StdioServer server(handler);
        std::string input;
        input += R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})"
                 "\n";
        input += R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})"
                 "\n";
        input += R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"missing"}})"
                 "\n";
        input += R"({"jsonrpc":"2.0","id":4,"method":"prompts/list"})"
                 "\n";
        std::istringstream in(input);
        std::ostringstream out;
        server.run(in, out);

        auto lines = read_lines(out.str());
        assert(lines.size() == 4);
        for (int i = 0; i < 4; ++i)
            assert(lines[i]["id"] == i + 1);
        assert(lines[0]["result"]["serverInfo"]["name"] == "stdio_test");
        assert(lines[1]["result"]["tools"][0]["name"] == "now");
        assert(lines[2]["error"]["code"] == -32602);
        assert(lines[3]["result"]["prompts"].empty());
        std::cout << "[PASS] Test 3: in-order responses\n";
    }

    // Test 4: handler exceptions become internal errors
    {
        LogCapture logs;
        server::StdioServer server(
            [](const mcp::jsonrpc::Request&) -> std::optional<mcp::jsonrpc::Response>
            { throw std::runtime_error("boom"); });
        std::istringstream in(R"({"jsonrpc":"2.0","id":9,"method":"ping"})"
                              "\n"
                              R"({"jsonrpc":"2.0","method":"ping"})"
                              "\n");
        std::ostringstream out;
        server.run(in, out);
        auto lines = read_lines(out.str());
        assert(lines.size() == 1);
        assert(lines[0]["id"] == 9);
        assert(lines[0]["error"]["code"] == -32603);
        assert(lines[0]["error"]["message"] == "boom");
        std::cout << "[PASS] Test 4: handler failure contained\n";
    }

    // Test 5: an unwritable output is fatal
    {
        server::StdioServer server(handler);
        std::istringstream in(R"({"jsonrpc":"2.0","id":1,"method":"ping"})"
                              "\n");
        std::ostringstream out;
        out.setstate(std::ios::badbit);
        bool threw = false;
        try
        {
            server.run(in, out);
        }
        catch (const TransportError&)
        {
            threw = true;
        }
        assert(threw);
        assert(!server.running());
        std::cout << "[PASS] Test 5: output failure raises TransportError\n";
    }

    // Test 6: stop() ends the loop after the current line
    {
        server::StdioServer* self = nullptr;
        int handled = 0;
        server::StdioServer server(
            [&](const mcp::jsonrpc::Request& request)
            {
                ++handled;
                self->stop();
                return dispatcher.handle(request);
            });
        self = &server;
        std::istringstream in(R"({"jsonrpc":"2.0","id":1,"method":"ping"})"
                              "\n"
                              R"({"jsonrpc":"2.0","id":2,"method":"ping"})"
                              "\n");
        std::ostringstream out;
        server.run(in, out);
        assert(handled == 1);
        assert(read_lines(out.str()).size() == 1);
        std::cout << "[PASS] Test 6: stop() honoured\n";
    }

    // Test 7: a stop() issued before run() is honoured, then consumed
    {
        int handled = 0;
        server::StdioServer server(
            [&](const mcp::jsonrpc::Request& request)
            {
                ++handled;
                return dispatcher.handle(request);
            });
        server.stop();

        std::istringstream in(R"({"jsonrpc":"2.0","id":1,"method":"ping"})"
                              "\n");
        std::ostringstream out;
        server.run(in, out);
        assert(handled == 0);
        assert(out.str().empty());
        assert(!server.running());

        std::istringstream again(R"({"jsonrpc":"2.0","id":2,"method":"ping"})"
                                 "\n");
        std::ostringstream again_out;
        server.run(again, again_out);
        assert(handled == 1);
        assert(read_lines(again_out.str()).size() == 1);
        std::cout << "[PASS] Test 7: early stop() not lost\n";
    }

    // Test 8: a line with invalid UTF-8 is skipped like any malformed line
    {
        LogCapture logs;
        server::StdioServer server(handler);
        std::istringstream in("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"tools/call\","
                              "\"params\":{\"name\":\"n\xff\xfe\"}}\n"
                              R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"now"}})"
                              "\n");
        std::ostringstream out;
        server.run(in, out);

        auto lines = read_lines(out.str());
        assert(lines.size() == 1);
        assert(lines[0]["id"] == 2);
        assert(!lines[0]["result"].contains("isError"));
        assert(logs.count(log::LogLevel::Error) == 1);
        std::cout << "[PASS] Test 8: invalid UTF-8 input skipped\n";
    }

    // Test 9: invalid UTF-8 in tool output still yields one well-formed line
    {
        auto bad_tools = std::make_shared<ToolRegistry>();
        bad_tools->register_capability(std::make_shared<tools::FunctionTool>(
            tools::Tool{"bad", std::nullopt, Json::object()},
            [](const std::optional<Json>&)
            { return std::vector<ContentBlock>{TextContent{"x\xff\xfey"}}; }));
        auto bad_dispatcher =
            mcp::DispatcherBuilder().with_server_info("utf8", "1.0.0").with_tools(bad_tools).build();

        server::StdioServer server([&bad_dispatcher](const mcp::jsonrpc::Request& request)
                                   { return bad_dispatcher.handle(request); });
        std::istringstream in(R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"bad"}})"
                              "\n");
        std::ostringstream out;
        server.run(in, out);

        const std::string raw = out.str();
        assert(std::count(raw.begin(), raw.end(), '\n') == 1);
        auto lines = read_lines(raw);
        assert(lines.size() == 1);
        const auto text = lines[0]["result"]["content"][0]["text"].get<std::string>();
        assert(text.front() == 'x');
        assert(text.back() == 'y');
        assert(text.find("\xEF\xBF\xBD") != std::string::npos); // U+FFFD
        std::cout << "[PASS] Test 9: invalid UTF-8 output replaced\n";
    }

    std::cout << "\nAll STDIO server tests passed!\n";
    return 0;
}

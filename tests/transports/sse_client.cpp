#include "../test_helpers.hpp"
#include "mcpgate/client/sse_client.hpp"
#include "mcpgate/discovery/discover.hpp"
#include "mcpgate/exceptions.hpp"

#include <atomic>
#include <cassert>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

using namespace mcpgate;
using namespace mcpgate::client;
using mcpgate::testing::CapturedLog;
using mcpgate::testing::expect_throw;
using mcpgate::testing::LocalServer;
using mcpgate::testing::mock_initialize_result;
using mcpgate::testing::mock_tools_result;
using mcpgate::testing::rpc_result;

namespace
{

/// HTTP+SSE MCP server: GET /sse streams events, POST /messages accepts requests
/// and pushes their responses onto the stream.
struct MockSseServer
{
    LocalServer local;
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> outbox;
    std::vector<Json> client_replies;
    std::vector<std::string> stream_headers;
    std::atomic<bool> close_stream{false};
    std::atomic<bool> stopping{false};
    std::atomic<int> streams_opened{0};

    MockSseServer()
    {
        local.server.Get("/sse",
                         [this](const httplib::Request& req, httplib::Response& res)
                         { open_stream(req, res, "/messages?sessionId=s1"); });
        local.server.Get("/sse-no-endpoint",
                         [this](const httplib::Request& req, httplib::Response& res)
                         { open_stream(req, res, ""); });
        local.server.Get("/sse-denied",
                         [](const httplib::Request&, httplib::Response& res)
                         {
                             res.status = 401;
                             res.set_content("unauthorized", "text/plain");
                         });
        local.server.Get("/sse-empty",
                         [](const httplib::Request&, httplib::Response& res)
                         { res.set_content(": nothing to say\n\n", "text/event-stream"); });
        local.server.Post("/messages",
                          [this](const httplib::Request& req, httplib::Response& res)
                          { handle_post(req, res); });
        local.start();
    }

    ~MockSseServer()
    {
        stopping = true;
        cv.notify_all();
        local.stop();
    }

    void push(const Json& message)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            outbox.push_back(message.dump());
        }
        cv.notify_all();
    }

    std::vector<Json> replies()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return client_replies;
    }

    void open_stream(const httplib::Request& req, httplib::Response& res,
                     const std::string& endpoint)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            stream_headers.push_back(req.get_header_value("Accept"));
            outbox.clear();
        }
        close_stream = false;
        ++streams_opened;

        auto greeted = std::make_shared<bool>(false);
        res.set_chunked_content_provider(
            "text/event-stream",
            [this, greeted, endpoint](size_t, httplib::DataSink& sink)
            {
                if (!*greeted)
                {
                    *greeted = true;
                    std::string hello = ": connected\n\n";
                    if (!endpoint.empty())
                        hello += "event: endpoint\ndata: " + endpoint + "\n\n";
                    sink.write(hello.data(), hello.size());
                }

                std::unique_lock<std::mutex> lock(mutex);
                cv.wait_for(lock, std::chrono::milliseconds(50),
                            [this] { return !outbox.empty() || close_stream || stopping; });
                if (stopping || close_stream)
                {
                    sink.done();
                    return true;
                }
                while (!outbox.empty())
                {
                    std::string frame = "event: message\ndata: " + outbox.front() + "\n\n";
                    outbox.pop_front();
                    if (!sink.write(frame.data(), frame.size()))
                        return false;
                }
                return sink.is_writable();
            });
    }

    void handle_post(const httplib::Request& req, httplib::Response& res)
    {
        Json body = Json::parse(req.body);
        if (!body.contains("method"))
        {
            std::lock_guard<std::mutex> lock(mutex);
            client_replies.push_back(body);
            res.status = 202;
            return;
        }
        if (!body.contains("id"))
        {
            res.status = 202;
            return;
        }

        std::string method = body["method"].get<std::string>();
        Json result = Json::object();
        if (method == "initialize")
        {
            result = mock_initialize_result();
        }
        else if (method == "tools/list")
        {
            push(Json{{"jsonrpc", "2.0"},
                      {"method", "notifications/tools/list_changed"}});
            push(Json{{"jsonrpc", "2.0"}, {"id", "srv-ping"}, {"method", "ping"}});
            push(Json{{"jsonrpc", "2.0"}, {"id", "srv-sample"}, {"method", "sampling/createMessage"}});
            push(Json{{"jsonrpc", "2.0"}, {"id", 999}, {"result", Json::object()}});
            result = mock_tools_result();
        }
        else if (method == "tools/call")
        {
            std::string name = body["params"].value("name", std::string());
            if (name == "never")
            {
                res.status = 202;
                return;
            }
            if (name == "drop-stream")
            {
                close_stream = true;
                cv.notify_all();
                res.status = 202;
                return;
            }
            result = Json{{"content", Json::array({Json{{"type", "text"}, {"text", name}}})}};
            if (name == "inline")
            {
                res.set_content(rpc_result(body, result), "application/json");
                return;
            }
        }
        else if (method == "prompts/list")
        {
            result = Json{{"prompts", Json::array({Json{{"name", "greet"}}})}};
        }
        else if (method == "resources/read")
        {
            result = Json{{"contents", Json::array({Json{{"uri", body["params"]["uri"]},
                                                         {"text", "hello"}}})}};
        }
        else if (method == "resources/list")
        {
            result = Json{{"resources", Json::array()}};
        }

        // Batched delivery exercises array payloads on the stream
        if (method == "prompts/list")
            push(Json::array({Json::parse(rpc_result(body, result))}));
        else
            push(Json::parse(rpc_result(body, result)));
        res.status = 202;
        res.set_content("Accepted", "text/plain");
    }
};

HttpClientConfig config_for(const std::string& url, CapturedLog& log,
                            const std::string& id = "legacy")
{
    HttpClientConfig cfg;
    cfg.id = id;
    cfg.url = url;
    cfg.logger = log.logger();
    cfg.timeout = std::chrono::milliseconds(5000);
    return cfg;
}

Context five_seconds()
{
    return Context::with_timeout(std::chrono::seconds(5));
}

} // namespace

static void test_end_to_end()
{
    std::cout << "Test: endpoint handshake and response routing...\n";
    CapturedLog log;
    MockSseServer mock;
    SseClient c(config_for(mock.local.url("/sse"), log));
    assert(!c.is_connected());
    assert(c.endpoint().empty());

    auto init = c.initialize(five_seconds());
    assert(init.serverInfo.name == "mock-server");
    assert(c.is_connected());
    assert(c.endpoint() == mock.local.url("/messages?sessionId=s1"));
    assert(mock.stream_headers.at(0) == "text/event-stream");

    auto tools = c.list_tools(five_seconds());
    assert(tools.size() == 1 && tools[0].name == "test_tool");

    assert(log.wait_for("dropping response for unknown id=999"));
    assert(log.wait_for("server notification 'notifications/tools/list_changed'"));

    // The ping and the unsupported request were answered on the message endpoint
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (mock.replies().size() < 2 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    auto replies = mock.replies();
    assert(replies.size() == 2);
    for (const auto& reply : replies)
    {
        if (reply["id"] == "srv-ping")
            assert(reply["result"] == Json::object());
        else
            assert(reply["error"]["code"] == -32601);
    }

    auto inline_call = c.call_tool(five_seconds(), "inline", Json::object());
    assert(inline_call.content[0].text == "inline");
    auto streamed_call = c.call_tool(five_seconds(), "streamed", Json::object());
    assert(streamed_call.content[0].text == "streamed");

    auto prompts = c.list_prompts(five_seconds());
    assert(prompts.size() == 1 && prompts[0].name == "greet");

    auto read = c.read_resource(five_seconds(), "file:///notes.txt");
    assert(read.contents.size() == 1);
    assert(read.contents[0].text == std::optional<std::string>("hello"));

    c.close();
    assert(!c.is_connected());
    assert(c.state() == State::Closed);
    assert(c.endpoint().empty());
    std::cout << "  [PASS]\n";
}

static void test_timeout_and_stream_loss()
{
    std::cout << "Test: unanswered call times out, lost stream fails the call...\n";
    CapturedLog log;
    MockSseServer mock;
    SseClient c(config_for(mock.local.url("/sse"), log, "flaky"));
    c.initialize(five_seconds());

    expect_throw<TimeoutError>(
        [&] { c.call_tool(Context::with_timeout(std::chrono::milliseconds(200)), "never", Json::object()); },
        "tools/call request failed [flaky]");
    assert(c.call_tool(five_seconds(), "after", Json::object()).content[0].text == "after");

    expect_throw<TransportError>([&] { c.call_tool(five_seconds(), "drop-stream", Json::object()); },
                                 "tools/call request failed [flaky]");
    assert(!c.is_connected());
    expect_throw<TransportError>([&] { c.list_tools(five_seconds()); }, "not connected");

    // Recovery is the caller's: close and initialize again
    c.close();
    c.initialize(five_seconds());
    assert(c.is_connected());
    assert(mock.streams_opened == 2);
    assert(c.list_tools(five_seconds()).size() == 1);
    std::cout << "  [PASS]\n";
}

static void test_stream_failures()
{
    std::cout << "Test: stream handshake failures...\n";
    CapturedLog log;
    MockSseServer mock;

    SseClient denied(config_for(mock.local.url("/sse-denied"), log, "denied"));
    auto status = expect_throw<HttpStatusError>([&] { denied.initialize(five_seconds()); },
                                                "initialize request failed [denied]");
    assert(status.status() == 401);
    assert(denied.state() == State::Uninitialized);

    SseClient empty(config_for(mock.local.url("/sse-empty"), log, "empty"));
    expect_throw<TransportError>([&] { empty.initialize(five_seconds()); },
                                 "event stream closed before the endpoint event");

    SseClient mute(config_for(mock.local.url("/sse-no-endpoint"), log, "mute"));
    auto start = std::chrono::steady_clock::now();
    expect_throw<TimeoutError>(
        [&] { mute.initialize(Context::with_timeout(std::chrono::milliseconds(300))); },
        "waiting for endpoint event");
    assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(3));

    // No network I/O at construction, failure surfaces on initialize
    SseClient nobody(config_for("http://127.0.0.1:9/sse", log, "nobody"));
    expect_throw<TransportError>([&] { nobody.initialize(five_seconds()); });
    expect_throw<ConfigError>([&] { SseClient bad(config_for("sse://host", log)); });
    std::cout << "  [PASS]\n";
}

static void test_discover_sse()
{
    std::cout << "Test: discover_sse...\n";
    CapturedLog log;
    MockSseServer mock;
    auto result = discovery::discover_sse(config_for(mock.local.url("/sse"), log, "sse-gw"),
                                          five_seconds());
    assert(result.serverInfo && result.serverInfo->name == "mock-server");
    assert(result.tools.size() == 1);
    assert(result.prompts.size() == 1);
    assert(result.resources.empty());
    assert(log.contains("[sse-gw] discovered MCP server mock-server"));
    std::cout << "  [PASS]\n";
}

int main()
{
    std::cout << "Running SSE client tests...\n";
    test_end_to_end();
    test_timeout_and_stream_loss();
    test_stream_failures();
    test_discover_sse();
    std::cout << "\n[OK] SSE client tests passed\n";
    return 0;
}

#include "../test_helpers.hpp"
#include "mcpgate/discovery/discover.hpp"
#include "mcpgate/exceptions.hpp"
#include "scripted_client.hpp"

#include <cassert>
#include <iostream>

using namespace mcpgate;
using namespace mcpgate::client;
using mcpgate::testing::CapturedLog;
using mcpgate::testing::expect_throw;
using mcpgate::testing::ScriptedClient;

static ClientOptions options_for(const std::string& id, CapturedLog& log)
{
    ClientOptions options;
    options.id = id;
    options.logger = log.logger();
    return options;
}

static void test_request_ids()
{
    std::cout << "Test: request ids start at 1 and increase...\n";
    CapturedLog log;
    ScriptedClient c(options_for("ids", log));
    assert(c.next_request_id() == 1);
    assert(c.next_request_id() == 2);
    assert(c.next_request_id() == 3);

    ScriptedClient fresh(options_for("fresh", log));
    fresh.initialize(Context::background());
    fresh.list_tools(Context::background());
    fresh.close();
    fresh.initialize(Context::background());
    assert(fresh.requests.size() == 3);
    assert(*fresh.requests[0].id == 1);
    assert(*fresh.requests[1].id == 2);
    // Ids are not reused after close
    assert(*fresh.requests[2].id == 3);
    std::cout << "  [PASS]\n";
}

static void test_state_transitions()
{
    std::cout << "Test: Uninitialized -> Ready -> Closed...\n";
    CapturedLog log;
    ScriptedClient c(options_for("state", log));
    auto ctx = Context::background();

    assert(c.state() == State::Uninitialized);
    assert(!c.server_info());
    expect_throw<StateError>([&] { c.list_tools(ctx); }, "client not initialized");
    expect_throw<StateError>([&] { c.read_resource(ctx, "file:///x"); }, "resources/read");

    auto init = c.initialize(ctx);
    assert(init.serverInfo.name == "mock-server");
    assert(c.state() == State::Ready);
    assert(c.server_info()->protocolVersion == std::optional<std::string>("2024-11-05"));
    assert(c.opens == 1);

    const auto& first = c.requests.front();
    assert(first.method == "initialize");
    assert((*first.params)["protocolVersion"] == "2024-11-05");
    assert((*first.params)["capabilities"] == Json::object());
    assert((*first.params)["clientInfo"]["name"] == "mcpgate-client");
    assert(c.notifications.size() == 1);
    assert(c.notifications[0].method == "notifications/initialized");
    assert(c.notifications[0].is_notification());

    expect_throw<StateError>([&] { c.initialize(ctx); }, "client already initialized");

    auto tools = c.list_tools(ctx);
    assert(tools.size() == 1 && tools[0].name == "test_tool");
    assert(tools[0].description == std::optional<std::string>("A test tool"));

    c.close();
    assert(c.state() == State::Closed);
    assert(!c.server_info());
    c.close();
    assert(c.state() == State::Closed);
    expect_throw<StateError>([&] { c.list_prompts(ctx); }, "client not initialized");

    // Re-open after close
    c.initialize(ctx);
    assert(c.state() == State::Ready);
    assert(c.opens == 2);
    std::cout << "  [PASS]\n";
}

static void test_failed_initialize_restores_state()
{
    std::cout << "Test: failed initialize leaves the client re-initializable...\n";
    CapturedLog log;
    bool fail = true;
    ScriptedClient c(options_for("flaky", log),
                     [&](const mcp::JsonRpcRequest& req)
                     {
                         if (fail)
                             return Json{{"jsonrpc", "2.0"},
                                         {"id", *req.id},
                                         {"error", Json{{"code", -32603}, {"message", "warming up"}}}};
                         return ScriptedClient::default_handler(req);
                     });
    auto err = expect_throw<ProtocolError>([&] { c.initialize(Context::background()); },
                                           "initialize request failed [flaky]: ");
    assert(err.code() == -32603);
    assert(err.remote_message() == "warming up");
    assert(c.state() == State::Uninitialized);

    fail = false;
    c.initialize(Context::background());
    assert(c.state() == State::Ready);
    std::cout << "  [PASS]\n";
}

static void test_notification_failure_keeps_ready()
{
    std::cout << "Test: initialized notification failure is reported, state stays Ready...\n";
    CapturedLog log;
    ScriptedClient c(options_for("notify", log));
    c.fail_notifications = true;
    expect_throw<TransportError>([&] { c.initialize(Context::background()); },
                                 "notifications/initialized request failed [notify]");
    assert(c.state() == State::Ready);
    std::cout << "  [PASS]\n";
}

static void test_correlation_and_protocol_errors()
{
    std::cout << "Test: mismatched ids and error responses fail the call...\n";
    CapturedLog log;
    ScriptedClient c(options_for("corr", log),
                     [](const mcp::JsonRpcRequest& req)
                     {
                         if (req.method == "tools/list")
                             return Json{{"jsonrpc", "2.0"},
                                         {"id", *req.id + 100},
                                         {"result", Json{{"tools", Json::array()}}}};
                         if (req.method == "tools/call")
                             return Json{{"jsonrpc", "2.0"},
                                         {"id", *req.id},
                                         {"error", Json{{"code", -32000},
                                                        {"message", "tool exploded"},
                                                        {"data", Json{{"tool", "x"}}}}}};
                         if (req.method == "prompts/list")
                             return Json{{"jsonrpc", "2.0"},
                                         {"id", *req.id},
                                         {"result", Json{{"prompts", "not-a-list"}}}};
                         return ScriptedClient::default_handler(req);
                     });
    auto ctx = Context::background();
    c.initialize(ctx);

    auto corr = expect_throw<CorrelationError>([&] { c.list_tools(ctx); },
                                               "tools/list request failed [corr]: ");
    assert(corr.expected() == 2);
    assert(corr.actual() == 102);

    auto proto = expect_throw<ProtocolError>(
        [&] { c.call_tool(ctx, "x", Json::object()); }, "server returned error -32000");
    assert(proto.code() == -32000);
    assert(proto.data() && Json::parse(*proto.data())["tool"] == "x");

    expect_throw<DecodeError>([&] { c.list_prompts(ctx); }, "prompts/list request failed [corr]");
    assert(c.state() == State::Ready);
    std::cout << "  [PASS]\n";
}

static void test_expired_context()
{
    std::cout << "Test: an expired context fails before sending...\n";
    CapturedLog log;
    ScriptedClient c(options_for("late", log));
    auto ctx = Context::background();
    ctx.cancel();
    expect_throw<TimeoutError>([&] { c.initialize(ctx); }, "initialize request failed [late]");
    assert(c.requests.empty());
    assert(c.state() == State::Uninitialized);
    std::cout << "  [PASS]\n";
}

static void test_unsupported_version_warns()
{
    std::cout << "Test: unsupported negotiated version logs a warning...\n";
    CapturedLog log;
    ScriptedClient c(options_for("future", log),
                     [](const mcp::JsonRpcRequest& req)
                     {
                         Json resp = ScriptedClient::default_handler(req);
                         if (req.method == "initialize")
                             resp["result"]["protocolVersion"] = "2099-01-01";
                         return resp;
                     });
    auto init = c.initialize(Context::background());
    assert(init.protocolVersion == "2099-01-01");
    assert(log.contains("unsupported protocol version '2099-01-01'", logging::Level::Warning));
    assert(log.contains("[future]"));
    std::cout << "  [PASS]\n";
}

static void test_discovery_partial_failure()
{
    std::cout << "Test: discovery tolerates list failures...\n";
    CapturedLog log;
    ScriptedClient c(options_for("partial", log),
                     [](const mcp::JsonRpcRequest& req)
                     {
                         if (req.method == "prompts/list" || req.method == "resources/list")
                             return Json{{"jsonrpc", "2.0"},
                                         {"id", *req.id},
                                         {"error", Json{{"code", -32601},
                                                        {"message", "Method not found"}}}};
                         return ScriptedClient::default_handler(req);
                     });
    auto result = discovery::discover(c, Context::background());
    assert(result.serverInfo && result.serverInfo->name == "mock-server");
    assert(result.tools.size() == 1);
    assert(result.prompts.empty());
    assert(result.resources.empty());
    assert(log.contains("failed to list prompts", logging::Level::Warning));
    assert(log.contains("failed to list resources", logging::Level::Warning));

    std::vector<std::string> order;
    for (const auto& r : c.requests)
        order.push_back(r.method);
    assert((order == std::vector<std::string>{"initialize", "tools/list", "prompts/list",
                                              "resources/list"}));

    // Already Ready: no second initialize
    discovery::discover(c, Context::background());
    assert(c.requests.size() == 7);
    std::cout << "  [PASS]\n";
}

static void test_discovery_initialize_failure()
{
    std::cout << "Test: discovery fails when initialize fails...\n";
    CapturedLog log;
    ScriptedClient c(options_for("down", log),
                     [](const mcp::JsonRpcRequest& req)
                     {
                         return Json{{"jsonrpc", "2.0"},
                                     {"id", *req.id},
                                     {"error", Json{{"code", -32603}, {"message", "nope"}}}};
                     });
    expect_throw<ProtocolError>([&] { discovery::discover(c, Context::background()); });
    assert(c.requests.size() == 1);
    std::cout << "  [PASS]\n";
}

int main()
{
    std::cout << "Running client state machine tests...\n";
    test_request_ids();
    test_state_transitions();
    test_failed_initialize_restores_state();
    test_notification_failure_keeps_ready();
    test_correlation_and_protocol_errors();
    test_expired_context();
    test_unsupported_version_warns();
    test_discovery_partial_failure();
    test_discovery_initialize_failure();
    std::cout << "\n[OK] state machine tests passed\n";
    return 0;
}

#include "mcpgate/client/stdio_client.hpp"
#include "mcpgate/exceptions.hpp"
#include "stdio_support.hpp"

#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <string>
#include <thread>

using namespace mcpgate;
using namespace mcpgate::client;
using mcpgate::testing::CapturedLog;
using mcpgate::testing::expect_throw;
using mcpgate::testing::mock_server_config;

int main()
{
    using namespace std::chrono;

    // Server that never responds -> the caller's deadline fires
    std::cout << "Test: unresponsive server triggers timeout...\n";
    {
        CapturedLog log;
        StdioClient c(mock_server_config("silent", log, "silent"));
        auto start = steady_clock::now();
        expect_throw<TimeoutError>(
            [&] { c.initialize(Context::with_timeout(milliseconds(200))); },
            "initialize request failed [silent]");
        auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start);
        std::cout << "  Elapsed: " << elapsed.count() << "ms\n";
        assert(elapsed < milliseconds(2000));
        assert(c.state() == State::Uninitialized);
        std::cout << "  [PASS] timeout raised\n";
    }

    // The configured per-request timeout applies without a caller deadline
    std::cout << "Test: configured timeout bounds a background call...\n";
    {
        CapturedLog log;
        auto cfg = mock_server_config("silent", log);
        cfg.timeout = milliseconds(150);
        StdioClient c(cfg);
        expect_throw<TimeoutError>([&] { c.initialize(Context::background()); },
                                   "deadline exceeded");
        std::cout << "  [PASS]\n";
    }

    // Cancelling from another thread aborts the wait
    std::cout << "Test: cancellation aborts a pending call...\n";
    {
        CapturedLog log;
        StdioClient c(mock_server_config("silent", log));
        auto ctx = Context::background();
        auto canceller = std::async(std::launch::async,
                                    [ctx]
                                    {
                                        std::this_thread::sleep_for(milliseconds(100));
                                        ctx.cancel();
                                    });
        expect_throw<TimeoutError>([&] { c.initialize(ctx); }, "cancelled");
        canceller.get();
        std::cout << "  [PASS]\n";
    }

    // A late answer to a timed-out call is discarded by the next call
    std::cout << "Test: late response for an abandoned id is discarded...\n";
    {
        CapturedLog log;
        StdioClient c(mock_server_config("slow-tools", log, "slow"));
        c.initialize(Context::with_timeout(seconds(5)));

        expect_throw<TimeoutError>([&] { c.list_tools(Context::with_timeout(milliseconds(100))); },
                                   "tools/list request failed [slow]");
        assert(c.state() == State::Ready);

        auto tools = c.list_tools(Context::with_timeout(seconds(5)));
        assert(tools.size() == 1 && tools[0].name == "test_tool");
        assert(log.contains("discarding late response for abandoned id=2"));
        std::cout << "  [PASS]\n";
    }

    // Single flight: a second caller waits for the first and gives up at its own deadline
    std::cout << "Test: concurrent caller times out waiting for the call in flight...\n";
    {
        CapturedLog log;
        StdioClient c(mock_server_config("slow-tools", log));
        c.initialize(Context::with_timeout(seconds(5)));

        auto first = std::async(std::launch::async,
                                [&] { return c.list_tools(Context::with_timeout(seconds(5))); });
        std::this_thread::sleep_for(milliseconds(100));
        expect_throw<TimeoutError>(
            [&] { c.list_prompts(Context::with_timeout(milliseconds(100))); },
            "waiting for another call in flight");
        assert(first.get().size() == 1);
        std::cout << "  [PASS]\n";
    }

    // A server that stops reading stdin cannot hold a large write past the deadline
    std::cout << "Test: blocked stdin write honours the deadline...\n";
    {
        CapturedLog log;
        StdioClient c(mock_server_config("deaf", log, "deaf"));
        c.initialize(Context::with_timeout(seconds(5)));

        Json args = {{"blob", std::string(1024 * 1024, 'x')}};
        auto start = steady_clock::now();
        expect_throw<TimeoutError>(
            [&] { c.call_tool(Context::with_timeout(milliseconds(300)), "echo", args); },
            "writing to server stdin");
        assert(steady_clock::now() - start < seconds(2));

        // Part of the line went out; later calls refuse the desynchronised stream
        expect_throw<TransportError>(
            [&] { c.list_tools(Context::with_timeout(seconds(1))); }, "interrupted write");

        start = steady_clock::now();
        c.close();
        assert(steady_clock::now() - start < seconds(2));
        assert(c.pid() == 0);
        std::cout << "  [PASS]\n";
    }

    // close() from another thread releases a caller stuck writing
    std::cout << "Test: close unblocks a call stuck on a full stdin...\n";
    {
        CapturedLog log;
        StdioClient c(mock_server_config("deaf", log, "deaf"));
        c.initialize(Context::with_timeout(seconds(5)));

        Json args = {{"blob", std::string(1024 * 1024, 'x')}};
        auto call = std::async(std::launch::async,
                               [&] { c.call_tool(Context::with_timeout(seconds(20)), "echo", args); });
        std::this_thread::sleep_for(milliseconds(200));

        auto start = steady_clock::now();
        c.close();
        assert(steady_clock::now() - start < seconds(2));
        assert(call.wait_for(seconds(2)) == std::future_status::ready);
        expect_throw<TransportError>([&] { call.get(); }, "tools/call request failed [deaf]");
        assert(c.state() == State::Closed);
        std::cout << "  [PASS]\n";
    }

    std::cout << "\n[OK] stdio timeout tests passed\n";
    return 0;
}

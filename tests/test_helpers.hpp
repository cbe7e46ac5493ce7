/// @file tests/test_helpers.hpp
/// @brief Shared helpers for the mcpgate test executables
#pragma once

#include "mcpgate/logging.hpp"
#include "mcpgate/types.hpp"

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#ifdef MCPGATE_TESTS_WITH_HTTP
#include <httplib.h>
#endif

namespace mcpgate::testing
{

/// Run @p fn and require it to throw E whose message contains @p needle
template <typename E, typename F>
E expect_throw(F&& fn, const std::string& needle = std::string())
{
    try
    {
        fn();
    }
    catch (const E& e)
    {
        if (!needle.empty() && std::string(e.what()).find(needle) == std::string::npos)
        {
            std::cerr << "  [FAIL] message '" << e.what() << "' does not contain '" << needle
                      << "'\n";
            std::abort();
        }
        return e;
    }
    std::cerr << "  [FAIL] expected exception containing '" << needle << "'\n";
    std::abort();
}

/// Logger sink that records every message for later inspection
class CapturedLog
{
  public:
    logging::Logger logger(logging::Level min_level = logging::Level::Debug)
    {
        auto entries = entries_;
        auto mutex = mutex_;
        return logging::Logger(
            [entries, mutex](logging::Level level, const std::string& msg)
            {
                std::lock_guard<std::mutex> lock(*mutex);
                entries->emplace_back(level, msg);
            },
            min_level);
    }

    bool contains(const std::string& needle,
                  std::optional<logging::Level> level = std::nullopt) const
    {
        std::lock_guard<std::mutex> lock(*mutex_);
        for (const auto& entry : *entries_)
            if ((!level || entry.first == *level) &&
                entry.second.find(needle) != std::string::npos)
                return true;
        return false;
    }

    /// Poll until @p needle shows up or @p timeout elapses
    bool wait_for(const std::string& needle,
                  std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) const
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (contains(needle))
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return contains(needle);
    }

  private:
    std::shared_ptr<std::vector<std::pair<logging::Level, std::string>>> entries_ =
        std::make_shared<std::vector<std::pair<logging::Level, std::string>>>();
    std::shared_ptr<std::mutex> mutex_ = std::make_shared<std::mutex>();
};

#ifdef MCPGATE_TESTS_WITH_HTTP
/// httplib::Server on an ephemeral loopback port, listening on its own thread
struct LocalServer
{
    httplib::Server server;
    std::thread thread;
    int port{0};

    ~LocalServer()
    {
        stop();
    }

    void start()
    {
        port = server.bind_to_any_port("127.0.0.1");
        assert(port > 0);
        thread = std::thread([this] { server.listen_after_bind(); });
        server.wait_until_ready();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    void stop()
    {
        server.stop();
        if (thread.joinable())
            thread.join();
    }

    std::string url(const std::string& path) const
    {
        return "http://127.0.0.1:" + std::to_string(port) + path;
    }
};

/// Reply to a JSON-RPC request body with @p result under the same id
inline std::string rpc_result(const Json& request, const Json& result)
{
    return Json{{"jsonrpc", "2.0"}, {"id", request.at("id")}, {"result", result}}.dump();
}

inline Json mock_initialize_result()
{
    return Json{{"protocolVersion", "2024-11-05"},
                {"capabilities", Json{{"tools", Json::object()}}},
                {"serverInfo", Json{{"name", "mock-server"}, {"version", "1.0.0"}}}};
}

inline Json mock_tools_result()
{
    return Json{{"tools", Json::array({Json{{"name", "test_tool"},
                                            {"description", "A test tool"},
                                            {"inputSchema", Json{{"type", "object"}}}}})}};
}
#endif

} // namespace mcpgate::testing

/// @file examples/client_api.cpp
/// @brief Example demonstrating discovery and the typed client API over stdio
/// @details Spawns an MCP server command, discovers its capabilities and calls the
///          first tool it offers.
///
/// Usage: mcpgate_example_client_api <command> [args...]
///   e.g. mcpgate_example_client_api npx -y @modelcontextprotocol/server-everything

#include <iostream>
#include "mcpgate.hpp"

using namespace mcpgate;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <command> [args...]\n";
        return 2;
    }

    client::StdioClientConfig cfg;
    cfg.id = "example";
    cfg.command = argv[1];
    for (int i = 2; i < argc; ++i)
        cfg.args.emplace_back(argv[i]);
    cfg.logger = logging::Logger(nullptr, logging::Level::Debug);

    try {
        client::StdioClient c(cfg);
        auto ctx = Context::with_timeout(std::chrono::seconds(30));

        // ========================================================================
        // Discovery
        // ========================================================================

        auto result = discovery::discover(c, ctx);
        std::cout << "Server: " << result.serverInfo->name << " " << result.serverInfo->version
                  << "\n";
        std::cout << Json(result).dump(2) << "\n";

        // ========================================================================
        // Tools
        // ========================================================================

        if (!result.tools.empty()) {
            const auto& tool = result.tools.front();
            auto call = c.call_tool(ctx, tool.name, Json::object());
            std::cout << "\n" << tool.name << (call.isError ? " failed:" : " returned:") << "\n";
            for (const auto& item : call.content)
                std::cout << "  [" << item.type << "] " << item.text << "\n";
        }

        // ========================================================================
        // Resources
        // ========================================================================

        if (!result.resources.empty()) {
            auto read = c.read_resource(ctx, result.resources.front().uri);
            for (const auto& content : read.contents)
                std::cout << "\n" << content.uri << ":\n" << content.text.value_or("<binary>")
                          << "\n";
        }

        c.close();
    } catch (const ProtocolError& e) {
        std::cerr << "Server error " << e.code() << ": " << e.what() << "\n";
        return 1;
    } catch (const Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

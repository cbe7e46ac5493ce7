#include "mcpgate/discovery/discover.hpp"

#include "mcpgate/client/http_client.hpp"
#include "mcpgate/client/sse_client.hpp"
#include "mcpgate/client/stdio_client.hpp"
#include "mcpgate/exceptions.hpp"

namespace mcpgate::discovery
{

namespace
{
logging::Logger tagged(const client::ClientOptions& options)
{
    return options.id.empty() ? options.logger : options.logger.with_tag(options.id);
}

/// Create, discover and close, logging each step against the connection id
template <typename Factory>
mcp::DiscoveryResult run(const client::ClientOptions& options, const std::string& kind,
                         const Context& ctx, Factory&& factory)
{
    auto log = tagged(options);

    std::unique_ptr<client::IClient> c;
    try
    {
        c = factory();
    }
    catch (const std::exception& e)
    {
        log.error("failed to create " + kind + " client: " + e.what());
        throw;
    }
    log.info("created " + kind + " client");

    mcp::DiscoveryResult result;
    try
    {
        result = c->discover(ctx);
    }
    catch (const std::exception& e)
    {
        log.error(std::string("failed to discover MCP server: ") + e.what());
        c->close();
        throw;
    }
    c->close();

    log.info("discovered MCP server " + (result.serverInfo ? result.serverInfo->name : "") +
             ": " + std::to_string(result.tools.size()) + " tools, " +
             std::to_string(result.prompts.size()) + " prompts, " +
             std::to_string(result.resources.size()) + " resources");
    return result;
}
} // namespace

mcp::DiscoveryResult discover(client::IClient& client, const Context& ctx)
{
    return client.discover(ctx);
}

std::unique_ptr<client::IClient> make_client(const client::ClientConfig& config)
{
    switch (config.transport)
    {
    case client::TransportKind::Stdio:
        return std::make_unique<client::StdioClient>(
            std::get<client::StdioClientConfig>(config.settings));
    case client::TransportKind::StreamableHttp:
        return std::make_unique<client::StreamableHttpClient>(
            std::get<client::HttpClientConfig>(config.settings));
    case client::TransportKind::Sse:
        return std::make_unique<client::SseClient>(
            std::get<client::HttpClientConfig>(config.settings));
    }
    throw ConfigError("unknown transport");
}

mcp::DiscoveryResult discover(const client::ClientConfig& config, const Context& ctx)
{
    return run(config.options(), client::to_string(config.transport), ctx,
               [&] { return make_client(config); });
}

mcp::DiscoveryResult discover_stdio(const client::StdioClientConfig& config, const Context& ctx)
{
    return run(config, "stdio", ctx,
               [&]() -> std::unique_ptr<client::IClient>
               { return std::make_unique<client::StdioClient>(config); });
}

mcp::DiscoveryResult discover_http(const client::HttpClientConfig& config, const Context& ctx)
{
    return run(config, "streamable_http", ctx,
               [&]() -> std::unique_ptr<client::IClient>
               { return std::make_unique<client::StreamableHttpClient>(config); });
}

mcp::DiscoveryResult discover_sse(const client::HttpClientConfig& config, const Context& ctx)
{
    return run(config, "sse", ctx,
               [&]() -> std::unique_ptr<client::IClient>
               { return std::make_unique<client::SseClient>(config); });
}

} // namespace mcpgate::discovery

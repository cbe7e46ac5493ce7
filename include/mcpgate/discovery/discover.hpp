#pragma once
/// @file discovery/discover.hpp
/// @brief Discovery entry points: initialize a backend and collect its capabilities

#include "mcpgate/client/client.hpp"
#include "mcpgate/client/config.hpp"
#include "mcpgate/context.hpp"
#include "mcpgate/mcp/types.hpp"

#include <memory>

namespace mcpgate::discovery
{

/// Run one discovery pass on an existing client. Only an initialize failure
/// propagates; list failures leave the corresponding vector empty.
mcp::DiscoveryResult discover(client::IClient& client, const Context& ctx);

/// Construct the transport named by config.transport. Stdio clients spawn
/// their process here.
std::unique_ptr<client::IClient> make_client(const client::ClientConfig& config);

/// Create a client, discover, close. The client is closed on every path.
mcp::DiscoveryResult discover(const client::ClientConfig& config,
                              const Context& ctx = Context::background());

mcp::DiscoveryResult discover_stdio(const client::StdioClientConfig& config,
                                    const Context& ctx = Context::background());
mcp::DiscoveryResult discover_http(const client::HttpClientConfig& config,
                                   const Context& ctx = Context::background());
mcp::DiscoveryResult discover_sse(const client::HttpClientConfig& config,
                                  const Context& ctx = Context::background());

} // namespace mcpgate::discovery

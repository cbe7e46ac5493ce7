#pragma once

/// @file mcpgate.hpp
/// @brief Main header for mcpgate - includes the client transports and discovery entry points
///
/// Usage:
/// @code
/// #include <mcpgate.hpp>
///
/// int main() {
///     mcpgate::client::StdioClientConfig cfg;
///     cfg.id = "filesystem";
///     cfg.command = "npx";
///     cfg.args = {"-y", "@modelcontextprotocol/server-filesystem", "/tmp"};
///
///     auto ctx = mcpgate::Context::with_timeout(std::chrono::seconds(30));
///     auto result = mcpgate::discovery::discover_stdio(cfg, ctx);
///     std::cout << mcpgate::Json(result).dump(2) << "\n";
/// }
/// @endcode

// Core types, errors and ambient configuration
#include "mcpgate/context.hpp"
#include "mcpgate/exceptions.hpp"
#include "mcpgate/logging.hpp"
#include "mcpgate/settings.hpp"
#include "mcpgate/types.hpp"
#include "mcpgate/version.hpp"

// Wire model
#include "mcpgate/mcp/jsonrpc.hpp"
#include "mcpgate/mcp/types.hpp"
#include "mcpgate/mcp/version.hpp"

// Clients
#include "mcpgate/client/client.hpp"
#include "mcpgate/client/config.hpp"
#include "mcpgate/client/http_client.hpp"
#include "mcpgate/client/sse_client.hpp"
#include "mcpgate/client/stdio_client.hpp"

// Discovery
#include "mcpgate/discovery/discover.hpp"

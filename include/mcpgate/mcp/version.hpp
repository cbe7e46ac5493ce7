#pragma once
#include <string>
#include <vector>

namespace mcpgate::mcp
{

constexpr const char* JSONRPC_VERSION = "2.0";

/// MCP protocol revisions are date strings (YYYY-MM-DD) naming the last
/// backward-incompatible change.
constexpr const char* MCP_VERSION_2024_11_05 = "2024-11-05";
constexpr const char* MCP_VERSION_2024_11_25 = "2024-11-25";
constexpr const char* MCP_VERSION_2025_06_18 = "2025-06-18";

constexpr const char* DEFAULT_MCP_VERSION = MCP_VERSION_2024_11_05;
constexpr const char* LATEST_MCP_VERSION = MCP_VERSION_2025_06_18;

/// Supported protocol versions, oldest to newest
const std::vector<std::string>& supported_versions();

bool is_version_supported(const std::string& version);

} // namespace mcpgate::mcp

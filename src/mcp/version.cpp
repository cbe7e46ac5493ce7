#include "mcpgate/mcp/version.hpp"

#include <algorithm>

namespace mcpgate::mcp
{

const std::vector<std::string>& supported_versions()
{
    static const std::vector<std::string> versions = {
        MCP_VERSION_2024_11_05,
        MCP_VERSION_2024_11_25,
        MCP_VERSION_2025_06_18,
    };
    return versions;
}

bool is_version_supported(const std::string& version)
{
    const auto& versions = supported_versions();
    return std::find(versions.begin(), versions.end(), version) != versions.end();
}

} // namespace mcpgate::mcp

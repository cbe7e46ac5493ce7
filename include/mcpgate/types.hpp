#pragma once
#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace mcpgate
{

using Json = nlohmann::json;

/// Extra HTTP headers or environment entries, ordered for stable output.
using StringMap = std::map<std::string, std::string>;

} // namespace mcpgate

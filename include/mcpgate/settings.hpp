#pragma once
#include "mcpgate/types.hpp"

#include <string>

namespace mcpgate
{

struct Settings
{
    std::string log_level{"INFO"};
    /// Default per-request timeout for clients whose configuration leaves it unset
    int default_timeout_ms{30000};

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace mcpgate

#include "mcpgate/settings.hpp"

#include "mcpgate/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace mcpgate
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static std::string upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

Settings Settings::from_env()
{
    Settings s;
    s.log_level = upper(getenv_str("MCPGATE_LOG_LEVEL", s.log_level));
    auto timeout = getenv_str("MCPGATE_TIMEOUT_MS", "");
    if (!timeout.empty())
    {
        try
        {
            s.default_timeout_ms = std::stoi(timeout);
        }
        catch (const std::exception&)
        {
            throw ConfigError("MCPGATE_TIMEOUT_MS is not a number: " + timeout);
        }
    }
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    try
    {
        if (j.contains("log_level"))
            s.log_level = upper(j.at("log_level").get<std::string>());
        if (j.contains("timeout_ms"))
            s.default_timeout_ms = j.at("timeout_ms").get<int>();
    }
    catch (const Json::exception& e)
    {
        throw ConfigError(std::string("invalid settings: ") + e.what());
    }
    return s;
}

} // namespace mcpgate

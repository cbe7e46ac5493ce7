#include "mcpgate/exceptions.hpp"
#include "mcpgate/logging.hpp"
#include "mcpgate/settings.hpp"

#include <cassert>
#include <cstdlib>
#include <string>
#include <vector>

static void set_env(const char* name, const char* value)
{
    setenv(name, value, 1);
}

int main()
{
    using namespace mcpgate;

    // JSON parse
    auto s = Settings::from_json(Json{{"log_level", "debug"}, {"timeout_ms", 1500}});
    assert(s.log_level == "DEBUG");
    assert(s.default_timeout_ms == 1500);

    bool rejected = false;
    try
    {
        Settings::from_json(Json{{"timeout_ms", "soon"}});
    }
    catch (const ConfigError&)
    {
        rejected = true;
    }
    assert(rejected);

    // Env parse (set locally)
    set_env("MCPGATE_LOG_LEVEL", "warn");
    set_env("MCPGATE_TIMEOUT_MS", "2500");
    auto e = Settings::from_env();
    assert(e.log_level == "WARN"); // uppercased
    assert(e.default_timeout_ms == 2500);

    set_env("MCPGATE_TIMEOUT_MS", "later");
    rejected = false;
    try
    {
        Settings::from_env();
    }
    catch (const ConfigError&)
    {
        rejected = true;
    }
    assert(rejected);
    unsetenv("MCPGATE_TIMEOUT_MS");

    // Level names
    assert(logging::level_from_string("warn") == logging::Level::Warning);
    assert(logging::level_from_string("Error") == logging::Level::Error);
    assert(logging::level_from_string("bogus") == logging::Level::Info);
    assert(logging::to_string(logging::Level::Debug) == "DEBUG");

    // The logger drops messages below its level and prefixes the tag
    std::vector<std::string> lines;
    auto logger = logging::Logger::from_settings(
        e, [&](logging::Level level, const std::string& msg)
        { lines.push_back(logging::to_string(level) + " " + msg); });
    logger.info("hidden");
    logger.warning("shown");
    auto tagged = logger.with_tag("backend-1");
    tagged.error("boom");
    assert(lines.size() == 2);
    assert(lines[0] == "WARNING shown");
    assert(lines[1] == "ERROR [backend-1] boom");
    assert(tagged.tag() == "backend-1");
    assert(logger.tag().empty());
    return 0;
}

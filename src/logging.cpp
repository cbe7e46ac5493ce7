#include "mcpgate/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>

namespace mcpgate::logging
{

std::string to_string(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARNING";
    case Level::Error:
        return "ERROR";
    }
    return "INFO";
}

Level level_from_string(const std::string& s)
{
    std::string lvl = s;
    std::transform(lvl.begin(), lvl.end(), lvl.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (lvl == "DEBUG" || lvl == "TRACE")
        return Level::Debug;
    if (lvl == "WARN" || lvl == "WARNING")
        return Level::Warning;
    if (lvl == "ERROR" || lvl == "CRITICAL")
        return Level::Error;
    return Level::Info;
}

Logger::Logger(LogCallback callback, Level min_level) : min_level_(min_level)
{
    if (!callback)
    {
        // Default: print to stderr, one line per message
        auto mutex = std::make_shared<std::mutex>();
        callback = [mutex](Level level, const std::string& msg)
        {
            std::lock_guard<std::mutex> lock(*mutex);
            std::cerr << "[mcpgate] " << to_string(level) << " " << msg << std::endl;
        };
    }
    callback_ = std::make_shared<LogCallback>(std::move(callback));
}

Logger Logger::from_settings(const Settings& settings, LogCallback callback)
{
    return Logger(std::move(callback), level_from_string(settings.log_level));
}

Logger Logger::with_tag(const std::string& tag) const
{
    Logger copy(*this);
    copy.tag_ = tag;
    return copy;
}

void Logger::log(Level level, const std::string& message) const
{
    if (!enabled(level))
        return;
    if (tag_.empty())
        (*callback_)(level, message);
    else
        (*callback_)(level, "[" + tag_ + "] " + message);
}

} // namespace mcpgate::logging

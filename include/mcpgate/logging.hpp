#pragma once
/// @file logging.hpp
/// @brief Injected log sink used by clients and the discovery orchestrator
/// @details Every client receives its Logger through its configuration; there is no
///          process-wide logger. Copies of a Logger share the same sink.

#include "mcpgate/settings.hpp"

#include <functional>
#include <memory>
#include <string>

namespace mcpgate::logging
{

enum class Level
{
    Debug,
    Info,
    Warning,
    Error
};

std::string to_string(Level level);

/// Parse "DEBUG", "INFO", "WARN"/"WARNING", "ERROR" (case-insensitive); unknown -> Info
Level level_from_string(const std::string& s);

class Logger
{
  public:
    using LogCallback = std::function<void(Level, const std::string&)>;

    /// @param callback Sink receiving formatted messages. Null selects the stderr sink.
    /// @param min_level Messages below this level are dropped before reaching the sink
    explicit Logger(LogCallback callback = nullptr, Level min_level = Level::Info);

    static Logger from_settings(const Settings& settings, LogCallback callback = nullptr);

    /// Logger sharing this sink whose messages are prefixed with "[tag] "
    Logger with_tag(const std::string& tag) const;

    const std::string& tag() const
    {
        return tag_;
    }
    Level min_level() const
    {
        return min_level_;
    }
    void set_min_level(Level level)
    {
        min_level_ = level;
    }

    bool enabled(Level level) const
    {
        return level >= min_level_;
    }

    void log(Level level, const std::string& message) const;
    void debug(const std::string& message) const
    {
        log(Level::Debug, message);
    }
    void info(const std::string& message) const
    {
        log(Level::Info, message);
    }
    void warning(const std::string& message) const
    {
        log(Level::Warning, message);
    }
    void error(const std::string& message) const
    {
        log(Level::Error, message);
    }

  private:
    std::shared_ptr<LogCallback> callback_;
    Level min_level_;
    std::string tag_;
};

} // namespace mcpgate::logging

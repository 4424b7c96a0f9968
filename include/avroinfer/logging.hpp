#pragma once
#include <functional>
#include <string>

namespace avroinfer
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

inline std::string to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    default:
        return "UNKNOWN";
    }
}

/// Parse a level name case-insensitively ("warn" is accepted for Warning).
/// Unknown names map to Info.
LogLevel log_level_from_string(const std::string& name);

/// (level, message, logger name)
using LogCallback = std::function<void(LogLevel, const std::string&, const std::string&)>;

/// Writes "[LEVEL] logger: message" lines to std::cerr.
LogCallback stderr_log_sink();

class Logger
{
  public:
    explicit Logger(std::string name = "avroinfer", LogLevel threshold = LogLevel::Info,
                    LogCallback sink = stderr_log_sink());

    void log(LogLevel level, const std::string& message) const;

    void debug(const std::string& message) const
    {
        log(LogLevel::Debug, message);
    }

    void info(const std::string& message) const
    {
        log(LogLevel::Info, message);
    }

    void warning(const std::string& message) const
    {
        log(LogLevel::Warning, message);
    }

    void error(const std::string& message) const
    {
        log(LogLevel::Error, message);
    }

    bool enabled(LogLevel level) const
    {
        return sink_ && static_cast<int>(level) >= static_cast<int>(threshold_);
    }

    const std::string& name() const
    {
        return name_;
    }

  private:
    std::string name_;
    LogLevel threshold_;
    LogCallback sink_;
};

} // namespace avroinfer

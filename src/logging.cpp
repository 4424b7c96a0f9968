#include "avroinfer/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <utility>

namespace avroinfer
{

LogLevel log_level_from_string(const std::string& name)
{
    std::string lvl = name;
    std::transform(lvl.begin(), lvl.end(), lvl.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (lvl == "DEBUG")
        return LogLevel::Debug;
    if (lvl == "WARNING" || lvl == "WARN")
        return LogLevel::Warning;
    if (lvl == "ERROR")
        return LogLevel::Error;
    return LogLevel::Info;
}

LogCallback stderr_log_sink()
{
    return [](LogLevel level, const std::string& message, const std::string& logger)
    {
        static std::mutex mu;
        std::lock_guard<std::mutex> lock(mu);
        std::cerr << "[" << to_string(level) << "] " << logger << ": " << message << std::endl;
    };
}

Logger::Logger(std::string name, LogLevel threshold, LogCallback sink)
    : name_(std::move(name)), threshold_(threshold), sink_(std::move(sink))
{
}

void Logger::log(LogLevel level, const std::string& message) const
{
    if (enabled(level))
        sink_(level, message, name_);
}

} // namespace avroinfer

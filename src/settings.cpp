#include "avroinfer/settings.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace avroinfer
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static std::size_t getenv_size(const char* key, std::size_t defv)
{
    const char* v = std::getenv(key);
    if (!v || !*v)
        return defv;
    try
    {
        auto parsed = std::stoul(v);
        return parsed > 0 ? static_cast<std::size_t>(parsed) : defv;
    }
    catch (const std::exception&)
    {
        throw Error(std::string("Invalid numeric value for ") + key + ": " + v);
    }
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("AVROINFER_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::toupper);
    s.log_level = lvl;
    auto mode = getenv_str("AVROINFER_MODE", s.mode);
    std::transform(mode.begin(), mode.end(), mode.begin(), ::tolower);
    s.mode = to_string(mode_from_string(mode));
    s.max_depth = getenv_size("AVROINFER_MAX_DEPTH", s.max_depth);
    s.record_name = getenv_str("AVROINFER_RECORD_NAME", s.record_name);
    s.max_groups = getenv_size("AVROINFER_MAX_GROUPS", s.max_groups);
    s.workers = getenv_size("AVROINFER_WORKERS", s.workers);
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    if (j.contains("mode"))
    {
        s.mode = to_string(mode_from_string(j.at("mode").get<std::string>()));
    }
    if (j.contains("max_depth"))
        s.max_depth = j.at("max_depth").get<std::size_t>();
    if (j.contains("record_name"))
        s.record_name = j.at("record_name").get<std::string>();
    if (j.contains("max_groups"))
    {
        s.max_groups = j.at("max_groups").get<std::size_t>();
        if (s.max_groups == 0)
            throw Error("max_groups must be at least 1");
    }
    if (j.contains("workers"))
        s.workers = j.at("workers").get<std::size_t>();
    return s;
}

DeriveOptions Settings::to_options() const
{
    DeriveOptions o;
    o.mode = mode_from_string(mode);
    o.max_depth = max_depth;
    o.record_name = record_name;
    o.max_groups = max_groups == 0 ? 1 : max_groups;
    o.workers = workers == 0 ? 1 : workers;
    o.log_level = log_level_from_string(log_level);
    return o;
}

} // namespace avroinfer

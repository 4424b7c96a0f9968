#pragma once
#include "avroinfer/logging.hpp"
#include "avroinfer/types.hpp"

#include <cstddef>
#include <string>

namespace avroinfer
{

/// Per-call configuration threaded through every derivation function.
struct DeriveOptions
{
    Mode mode{Mode::Strict};
    std::size_t max_depth{256};
    std::string record_name{"Record"};
    std::size_t max_groups{3};
    std::size_t workers{1};
    LogLevel log_level{LogLevel::Info};
    LogCallback log_sink{stderr_log_sink()};

    static DeriveOptions strict()
    {
        return DeriveOptions{};
    }

    static DeriveOptions lenient()
    {
        DeriveOptions o;
        o.mode = Mode::Lenient;
        return o;
    }
};

struct Settings
{
    std::string log_level{"INFO"};
    std::string mode{"strict"};
    std::size_t max_depth{256};
    std::string record_name{"Record"};
    std::size_t max_groups{3};
    std::size_t workers{1};

    static Settings from_env();
    static Settings from_json(const Json& j);

    DeriveOptions to_options() const;
};

} // namespace avroinfer

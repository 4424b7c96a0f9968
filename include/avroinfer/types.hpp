#pragma once
#include "avroinfer/exceptions.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace avroinfer
{

using Json = nlohmann::json;

/// Key-order-preserving JSON used for rendered schemas, so that output reads
/// `{"type":"record","name":...,"fields":[...]}` in that order.
using OrderedJson = nlohmann::ordered_json;

/// Conflict policy of a derivation call.
enum class Mode
{
    Strict,  ///< Fail on ambiguous types; unions for legitimate record conflicts
    Lenient  ///< Widen aggressively; majority vote on conflicts, never unions
};

inline std::string to_string(Mode mode)
{
    switch (mode)
    {
    case Mode::Strict:
        return "strict";
    case Mode::Lenient:
        return "lenient";
    }
    return "strict";
}

inline Mode mode_from_string(const std::string& s)
{
    if (s == "strict" || s == "STRICT")
        return Mode::Strict;
    if (s == "lenient" || s == "LENIENT")
        return Mode::Lenient;
    throw Error("Unknown derivation mode: " + s);
}

} // namespace avroinfer

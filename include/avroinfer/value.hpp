#pragma once
#include "avroinfer/result.hpp"
#include "avroinfer/types.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace avroinfer
{

/// A JSON number as written in the source text.
struct Number
{
    std::string lexeme; ///< Digits as parsed, e.g. "-12", "1e16", "62.41"
    bool integral{true}; ///< false when the lexeme carries '.', 'e' or 'E'
};

/// Read-only parsed document tree. Mapping keys are unique and keep source order.
struct ParsedValue
{
    using array_t = std::vector<ParsedValue>;
    using object_t = std::vector<std::pair<std::string, ParsedValue>>;
    using variant_t = std::variant<std::nullptr_t, bool, Number, std::string, array_t, object_t>;

    variant_t value;

    ParsedValue() : value(nullptr) {}
    ParsedValue(std::nullptr_t v) : value(v) {}
    ParsedValue(bool v) : value(v) {}
    ParsedValue(Number v) : value(std::move(v)) {}
    ParsedValue(std::string v) : value(std::move(v)) {}
    ParsedValue(array_t v) : value(std::move(v)) {}
    ParsedValue(object_t v) : value(std::move(v)) {}

    bool is_null() const
    {
        return std::holds_alternative<std::nullptr_t>(value);
    }
    bool is_boolean() const
    {
        return std::holds_alternative<bool>(value);
    }
    bool is_number() const
    {
        return std::holds_alternative<Number>(value);
    }
    bool is_string() const
    {
        return std::holds_alternative<std::string>(value);
    }
    bool is_array() const
    {
        return std::holds_alternative<array_t>(value);
    }
    bool is_object() const
    {
        return std::holds_alternative<object_t>(value);
    }

    const array_t& as_array() const
    {
        return std::get<array_t>(value);
    }
    const object_t& as_object() const
    {
        return std::get<object_t>(value);
    }
    const Number& as_number() const
    {
        return std::get<Number>(value);
    }
};

/// Parse one document. Integral literals beyond 64 bits keep their digits.
Result<ParsedValue> try_parse_document(const std::string& text, std::size_t max_depth = 256);

/// Throwing form of try_parse_document (ParseError, DepthLimitError).
ParsedValue parse_document(const std::string& text, std::size_t max_depth = 256);

/// Convert an already-parsed nlohmann value.
Result<ParsedValue> try_from_json(const Json& j, std::size_t max_depth = 256);
ParsedValue from_json(const Json& j, std::size_t max_depth = 256);

/// Split message text: a top-level array yields one message per element,
/// anything else is a single message.
std::vector<ParsedValue> read_messages(const std::string& text, std::size_t max_depth = 256);

} // namespace avroinfer

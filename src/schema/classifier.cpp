#include "avroinfer/schema/classifier.hpp"

#include <charconv>
#include <cstdint>
#include <limits>
#include <system_error>

namespace avroinfer::schema
{

Result<PrimitiveKind> classify_number(const Number& number, Mode mode)
{
    if (!number.integral)
        return PrimitiveKind::Double;

    const char* first = number.lexeme.data();
    const char* last = first + number.lexeme.size();
    std::int64_t parsed = 0;
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec == std::errc::result_out_of_range)
    {
        if (mode == Mode::Lenient)
            return PrimitiveKind::Double;
        return make_error(ErrorKind::Range,
                          "integer " + number.lexeme + " does not fit in 64 bits");
    }
    if (ec != std::errc() || ptr != last)
        return make_error(ErrorKind::InvalidStructure, "malformed number " + number.lexeme);

    if (parsed >= std::numeric_limits<std::int32_t>::min() &&
        parsed <= std::numeric_limits<std::int32_t>::max())
        return PrimitiveKind::Int;
    return PrimitiveKind::Long;
}

Result<PrimitiveKind> classify(const ParsedValue& value, Mode mode)
{
    if (value.is_null())
        return PrimitiveKind::Null;
    if (value.is_boolean())
        return PrimitiveKind::Boolean;
    if (value.is_string())
        return PrimitiveKind::String;
    if (value.is_number())
        return classify_number(value.as_number(), mode);
    return make_error(ErrorKind::InvalidStructure, "arrays and mappings have no primitive kind");
}

} // namespace avroinfer::schema

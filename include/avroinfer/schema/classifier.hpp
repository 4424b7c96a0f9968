#pragma once
#include "avroinfer/result.hpp"
#include "avroinfer/schema/type_node.hpp"
#include "avroinfer/types.hpp"
#include "avroinfer/value.hpp"

namespace avroinfer::schema
{

/// Primitive kind of a scalar value.
///
/// Integral numbers take the narrowest of int (32-bit) and long (64-bit).
/// Beyond 64 bits strict mode fails with ErrorKind::Range and lenient mode
/// answers double. Non-integral numbers are always double. Arrays and
/// mappings are not scalars and fail with ErrorKind::InvalidStructure.
Result<PrimitiveKind> classify(const ParsedValue& value, Mode mode);

/// Classification of a number lexeme alone.
Result<PrimitiveKind> classify_number(const Number& number, Mode mode);

} // namespace avroinfer::schema

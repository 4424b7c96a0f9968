#pragma once
#include "avroinfer/exceptions.hpp"
#include "avroinfer/types.hpp"

namespace avroinfer::util::conformance
{

/// Check that a JSON value is accepted by a rendered schema, throwing
/// ValidationError with the offending path otherwise.
///
/// Records need every field present and accept no extra ones. Numbers widen
/// along int < long < double. A union accepts either the Avro JSON encoding
/// {"<branch>": value} or any branch that takes the bare value.
void check(const OrderedJson& schema, const Json& instance);

/// Non-throwing form of check().
bool conforms(const OrderedJson& schema, const Json& instance);

} // namespace avroinfer::util::conformance

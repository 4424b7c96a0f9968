#pragma once
#include "avroinfer/result.hpp"
#include "avroinfer/schema/type_node.hpp"

#include <vector>

namespace avroinfer::schema
{

/// Build a union from candidates that could not be merged (strict mode only).
///
/// A record whose single field is named after a branch keyword ("long",
/// "array", ...) is an encoded union value and is unwrapped into that branch.
/// Other records stay record branches under their own name. Branches with the
/// same key are unified; a clash on a shared field is ErrorKind::InvalidStructure
/// naming that field. A candidate that is already a union contributes its
/// branches. At least one candidate must be record-shaped; otherwise there is
/// no legitimate union and the result is ErrorKind::TypeConflict.
Result<TypeNode> synthesize_union(const std::vector<TypeNode>& candidates);

} // namespace avroinfer::schema

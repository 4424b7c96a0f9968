#pragma once
#include "avroinfer/result.hpp"
#include "avroinfer/schema/type_node.hpp"
#include "avroinfer/types.hpp"

#include <vector>

namespace avroinfer::schema
{

/// Least upper bound of two types.
///
/// Numeric widening follows int < long < double and never narrows. Null is
/// neutral. Strings only unify with strings. Booleans widen into numbers in
/// lenient mode only. Records go through merge_records(); when that fails in
/// strict mode the candidates are handed to synthesize_union(), while lenient
/// mode settles each conflicting field on its first-seen type.
Result<TypeNode> unify(const TypeNode& a, const TypeNode& b, Mode mode);

/// Same as unify() but never builds a union, whatever the mode.
Result<TypeNode> unify_without_union(const TypeNode& a, const TypeNode& b, Mode mode);

/// Single item type for a collection of element types (array elements).
///
/// Strict folds every element with unify(). Lenient first folds strictly
/// without unions and, when that fails, picks the element type that occurs
/// most often, ties going to the earliest occurrence. An empty collection
/// yields null.
Result<TypeNode> resolve_items(const std::vector<TypeNode>& elements, Mode mode);

/// True when a and b differ at most by numeric widening: same record names and
/// field sets, same array nesting and same union branch keys at every level.
bool same_shape(const TypeNode& a, const TypeNode& b);

} // namespace avroinfer::schema

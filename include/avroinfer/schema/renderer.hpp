#pragma once
#include "avroinfer/schema/type_node.hpp"
#include "avroinfer/types.hpp"

#include <string>

namespace avroinfer::schema
{

/// Canonical schema JSON of a type tree.
///
/// Primitives render as their keyword, arrays as {"type":"array","items":T},
/// records as {"type":"record","name":N,"fields":[{"name":F,"type":T},...]}
/// and unions as a JSON array of their branches. An array branch inside a
/// union also carries its name: {"name":"array","type":"array","items":T}.
OrderedJson render(const TypeNode& node);

/// Compact text of render(node); equal trees give byte-identical text.
std::string render_text(const TypeNode& node);

} // namespace avroinfer::schema

#pragma once
#include "avroinfer/result.hpp"
#include "avroinfer/schema/type_node.hpp"
#include "avroinfer/types.hpp"
#include "avroinfer/value.hpp"

#include <cstddef>
#include <string>

namespace avroinfer::schema
{

/// Builds type trees from parsed values and merges record shapes.
///
/// A nested record is named after the field that holds it, so naming is by
/// position rather than by content. Traversal depth is bounded by max_depth.
class StructuralMerger
{
  public:
    StructuralMerger(Mode mode, std::size_t max_depth) : mode_(mode), max_depth_(max_depth) {}

    /// Type of any value; records and arrays found inside take `name`.
    Result<TypeNode> build(const ParsedValue& value, const std::string& name) const;

    /// Record type of a mapping. Empty record or field names fail with
    /// ErrorKind::InvalidName.
    Result<TypeNode> build_record(const ParsedValue::object_t& members,
                                  const std::string& name) const;

  private:
    Result<TypeNode> build_at(const ParsedValue& value, const std::string& name,
                              std::size_t depth) const;
    Result<TypeNode> build_record_at(const ParsedValue::object_t& members,
                                     const std::string& name, std::size_t depth) const;
    Result<TypeNode> build_array_at(const ParsedValue::array_t& elements,
                                    const std::string& name, std::size_t depth) const;

    Mode mode_;
    std::size_t max_depth_;
};

/// Merge two records by field-name union; shared fields are unified.
///
/// Strict mode only merges when one field set contains the other and every
/// shared field unifies; anything else is ErrorKind::TypeConflict (the caller
/// decides whether a union applies). Lenient mode always takes the field
/// union and keeps the first record's type for a field that cannot be unified.
Result<TypeNode> merge_records(const TypeNode& a, const TypeNode& b, Mode mode);

} // namespace avroinfer::schema

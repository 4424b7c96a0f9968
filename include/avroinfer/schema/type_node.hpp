#pragma once
#include <string>
#include <vector>

namespace avroinfer::schema
{

enum class PrimitiveKind
{
    Null,
    Boolean,
    Int,
    Long,
    Double,
    String
};

/// Avro keyword of a primitive kind ("null", "boolean", ...).
const char* keyword(PrimitiveKind kind);

/// Reverse of keyword(); returns false for anything that is not a primitive keyword.
bool primitive_from_keyword(const std::string& word, PrimitiveKind& out);

inline bool is_numeric(PrimitiveKind kind)
{
    return kind == PrimitiveKind::Int || kind == PrimitiveKind::Long ||
           kind == PrimitiveKind::Double;
}

struct Field;

/// Derived type tree.
///
/// Records keep their fields sorted ascending by name. Unions hold flattened
/// branches that are unique by branch key (primitive keyword, record name, or
/// "array"), stored in rendering order.
struct TypeNode
{
    enum class Kind
    {
        Primitive,
        Array,
        Record,
        Union
    };

    Kind kind{Kind::Primitive};
    PrimitiveKind primitive{PrimitiveKind::Null};
    std::string name;               ///< Record name; "array" on an array union branch
    std::vector<TypeNode> children; ///< Array: the item type. Union: the branches
    std::vector<Field> fields;      ///< Record fields, ascending by name

    static TypeNode make_primitive(PrimitiveKind kind);
    static TypeNode make_array(TypeNode item);
    static TypeNode make_record(std::string name, std::vector<Field> fields);
    static TypeNode make_union(std::vector<TypeNode> branches);

    bool is_primitive() const
    {
        return kind == Kind::Primitive;
    }
    bool is_primitive(PrimitiveKind k) const
    {
        return kind == Kind::Primitive && primitive == k;
    }
    bool is_array() const
    {
        return kind == Kind::Array;
    }
    bool is_record() const
    {
        return kind == Kind::Record;
    }
    bool is_union() const
    {
        return kind == Kind::Union;
    }

    const TypeNode& item() const
    {
        return children.front();
    }

    /// Field by name, or nullptr.
    const Field* find_field(const std::string& field_name) const;

    /// Key under which this node sits in a union.
    std::string branch_key() const;
};

struct Field
{
    std::string name;
    TypeNode type;
};

bool operator==(const TypeNode& a, const TypeNode& b);
inline bool operator!=(const TypeNode& a, const TypeNode& b)
{
    return !(a == b);
}

} // namespace avroinfer::schema

#include "avroinfer/schema/type_node.hpp"

#include <algorithm>
#include <utility>

namespace avroinfer::schema
{

const char* keyword(PrimitiveKind kind)
{
    switch (kind)
    {
    case PrimitiveKind::Null:
        return "null";
    case PrimitiveKind::Boolean:
        return "boolean";
    case PrimitiveKind::Int:
        return "int";
    case PrimitiveKind::Long:
        return "long";
    case PrimitiveKind::Double:
        return "double";
    case PrimitiveKind::String:
        return "string";
    }
    return "null";
}

bool primitive_from_keyword(const std::string& word, PrimitiveKind& out)
{
    static const PrimitiveKind all[] = {PrimitiveKind::Null, PrimitiveKind::Boolean,
                                        PrimitiveKind::Int,  PrimitiveKind::Long,
                                        PrimitiveKind::Double, PrimitiveKind::String};
    for (auto kind : all)
    {
        if (word == keyword(kind))
        {
            out = kind;
            return true;
        }
    }
    return false;
}

TypeNode TypeNode::make_primitive(PrimitiveKind kind)
{
    TypeNode n;
    n.kind = Kind::Primitive;
    n.primitive = kind;
    return n;
}

TypeNode TypeNode::make_array(TypeNode item)
{
    TypeNode n;
    n.kind = Kind::Array;
    n.children.push_back(std::move(item));
    return n;
}

TypeNode TypeNode::make_record(std::string name, std::vector<Field> fields)
{
    TypeNode n;
    n.kind = Kind::Record;
    n.name = std::move(name);
    n.fields = std::move(fields);
    std::sort(n.fields.begin(), n.fields.end(),
              [](const Field& a, const Field& b) { return a.name < b.name; });
    return n;
}

TypeNode TypeNode::make_union(std::vector<TypeNode> branches)
{
    TypeNode n;
    n.kind = Kind::Union;
    for (auto& b : branches)
    {
        if (b.is_union())
        {
            for (auto& inner : b.children)
                n.children.push_back(std::move(inner));
        }
        else
        {
            n.children.push_back(std::move(b));
        }
    }
    // Primitive keywords first in lexical order, then named branches by name.
    std::stable_sort(n.children.begin(), n.children.end(),
                     [](const TypeNode& a, const TypeNode& b)
                     {
                         if (a.is_primitive() != b.is_primitive())
                             return a.is_primitive();
                         return a.branch_key() < b.branch_key();
                     });
    return n;
}

const Field* TypeNode::find_field(const std::string& field_name) const
{
    auto it = std::lower_bound(fields.begin(), fields.end(), field_name,
                               [](const Field& f, const std::string& n) { return f.name < n; });
    if (it == fields.end() || it->name != field_name)
        return nullptr;
    return &*it;
}

std::string TypeNode::branch_key() const
{
    switch (kind)
    {
    case Kind::Primitive:
        return keyword(primitive);
    case Kind::Array:
        return "array";
    case Kind::Record:
        return name;
    case Kind::Union:
        break;
    }
    return {};
}

bool operator==(const TypeNode& a, const TypeNode& b)
{
    if (a.kind != b.kind)
        return false;
    switch (a.kind)
    {
    case TypeNode::Kind::Primitive:
        return a.primitive == b.primitive;
    case TypeNode::Kind::Array:
        return a.name == b.name && a.item() == b.item();
    case TypeNode::Kind::Union:
        return a.children == b.children;
    case TypeNode::Kind::Record:
        break;
    }
    if (a.name != b.name || a.fields.size() != b.fields.size())
        return false;
    for (std::size_t i = 0; i < a.fields.size(); ++i)
    {
        if (a.fields[i].name != b.fields[i].name || a.fields[i].type != b.fields[i].type)
            return false;
    }
    return true;
}

} // namespace avroinfer::schema

#include "avroinfer/schema/merger.hpp"
#include "avroinfer/schema/classifier.hpp"
#include "avroinfer/schema/unifier.hpp"

#include <utility>
#include <vector>

namespace avroinfer::schema
{

Result<TypeNode> StructuralMerger::build(const ParsedValue& value, const std::string& name) const
{
    return build_at(value, name, 0);
}

Result<TypeNode> StructuralMerger::build_record(const ParsedValue::object_t& members,
                                                const std::string& name) const
{
    return build_record_at(members, name, 0);
}

Result<TypeNode> StructuralMerger::build_at(const ParsedValue& value, const std::string& name,
                                            std::size_t depth) const
{
    if (value.is_object())
        return build_record_at(value.as_object(), name, depth);
    if (value.is_array())
        return build_array_at(value.as_array(), name, depth);

    auto kind = classify(value, mode_);
    if (!kind)
        return kind.error();
    return TypeNode::make_primitive(kind.value());
}

Result<TypeNode> StructuralMerger::build_record_at(const ParsedValue::object_t& members,
                                                   const std::string& name,
                                                   std::size_t depth) const
{
    if (depth >= max_depth_)
        return make_error(ErrorKind::DepthLimit,
                          "nesting exceeds " + std::to_string(max_depth_) + " levels");
    if (name.empty())
        return make_error(ErrorKind::InvalidName, "record name must not be empty");

    std::vector<Field> fields;
    fields.reserve(members.size());
    for (const auto& [key, child] : members)
    {
        if (key.empty())
            return make_error(ErrorKind::InvalidName,
                              "field name must not be empty in record '" + name + "'");
        auto type = build_at(child, key, depth + 1);
        if (!type)
            return type.error();
        fields.push_back(Field{key, type.take()});
    }
    return TypeNode::make_record(name, std::move(fields));
}

Result<TypeNode> StructuralMerger::build_array_at(const ParsedValue::array_t& elements,
                                                  const std::string& name,
                                                  std::size_t depth) const
{
    if (depth >= max_depth_)
        return make_error(ErrorKind::DepthLimit,
                          "nesting exceeds " + std::to_string(max_depth_) + " levels");

    std::vector<TypeNode> types;
    types.reserve(elements.size());
    for (const auto& el : elements)
    {
        auto type = build_at(el, name, depth + 1);
        if (!type)
            return type.error();
        types.push_back(type.take());
    }

    auto item = resolve_items(types, mode_);
    if (!item)
        return make_error(item.error().kind,
                          "array '" + name + "': " + item.error().message);
    return TypeNode::make_array(item.take());
}

Result<TypeNode> merge_records(const TypeNode& a, const TypeNode& b, Mode mode)
{
    const std::string& name = a.name <= b.name ? a.name : b.name;

    std::vector<Field> fields;
    bool a_only = false;
    bool b_only = false;
    std::size_t i = 0;
    std::size_t j = 0;
    while (i < a.fields.size() || j < b.fields.size())
    {
        if (j == b.fields.size() || (i < a.fields.size() && a.fields[i].name < b.fields[j].name))
        {
            fields.push_back(a.fields[i++]);
            a_only = true;
            continue;
        }
        if (i == a.fields.size() || b.fields[j].name < a.fields[i].name)
        {
            fields.push_back(b.fields[j++]);
            b_only = true;
            continue;
        }

        const Field& fa = a.fields[i++];
        const Field& fb = b.fields[j++];
        auto type = unify(fa.type, fb.type, mode);
        if (type)
        {
            fields.push_back(Field{fa.name, type.take()});
            continue;
        }
        if (mode == Mode::Lenient)
        {
            fields.push_back(fa);
            continue;
        }
        ErrorKind kind = type.error().kind == ErrorKind::InvalidStructure
                             ? ErrorKind::InvalidStructure
                             : ErrorKind::TypeConflict;
        return make_error(kind, "field '" + fa.name + "' of record '" + name +
                                    "': " + type.error().message);
    }

    if (mode == Mode::Strict && a_only && b_only)
        return make_error(ErrorKind::TypeConflict,
                          "records '" + name + "' have unrelated field sets");

    return TypeNode::make_record(name, std::move(fields));
}

} // namespace avroinfer::schema

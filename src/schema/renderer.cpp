#include "avroinfer/schema/renderer.hpp"

namespace avroinfer::schema
{

OrderedJson render(const TypeNode& node)
{
    switch (node.kind)
    {
    case TypeNode::Kind::Primitive:
        return keyword(node.primitive);

    case TypeNode::Kind::Array:
    {
        OrderedJson out = OrderedJson::object();
        if (!node.name.empty())
            out["name"] = node.name;
        out["type"] = "array";
        out["items"] = render(node.item());
        return out;
    }

    case TypeNode::Kind::Union:
    {
        OrderedJson out = OrderedJson::array();
        for (const auto& branch : node.children)
            out.push_back(render(branch));
        return out;
    }

    case TypeNode::Kind::Record:
        break;
    }

    OrderedJson fields = OrderedJson::array();
    for (const auto& field : node.fields)
    {
        OrderedJson f = OrderedJson::object();
        f["name"] = field.name;
        f["type"] = render(field.type);
        fields.push_back(std::move(f));
    }
    OrderedJson out = OrderedJson::object();
    out["type"] = "record";
    out["name"] = node.name;
    out["fields"] = std::move(fields);
    return out;
}

std::string render_text(const TypeNode& node)
{
    return render(node).dump();
}

} // namespace avroinfer::schema

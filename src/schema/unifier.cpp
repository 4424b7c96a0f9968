#include "avroinfer/schema/unifier.hpp"
#include "avroinfer/schema/merger.hpp"
#include "avroinfer/schema/renderer.hpp"
#include "avroinfer/schema/union_synth.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>

namespace avroinfer::schema
{
namespace
{

enum class UnionPolicy
{
    Allow,
    Forbid
};

int numeric_rank(PrimitiveKind kind)
{
    switch (kind)
    {
    case PrimitiveKind::Int:
        return 0;
    case PrimitiveKind::Long:
        return 1;
    case PrimitiveKind::Double:
        return 2;
    default:
        return -1;
    }
}

DeriveError conflict(const TypeNode& a, const TypeNode& b)
{
    return make_error(ErrorKind::TypeConflict,
                      "cannot unify " + render_text(a) + " with " + render_text(b));
}

Result<TypeNode> unify_primitives(const TypeNode& a, const TypeNode& b, Mode mode)
{
    PrimitiveKind x = a.primitive;
    PrimitiveKind y = b.primitive;
    if (x == y)
        return a;
    if (x == PrimitiveKind::String || y == PrimitiveKind::String)
        return conflict(a, b);

    if (x == PrimitiveKind::Boolean || y == PrimitiveKind::Boolean)
    {
        // Lenient reads booleans as 0/1, which every numeric kind holds.
        if (mode == Mode::Strict)
            return conflict(a, b);
        return x == PrimitiveKind::Boolean ? b : a;
    }

    return numeric_rank(x) >= numeric_rank(y) ? a : b;
}

Result<TypeNode> unify_impl(const TypeNode& a, const TypeNode& b, Mode mode, UnionPolicy policy)
{
    if (a.is_primitive(PrimitiveKind::Null))
        return b;
    if (b.is_primitive(PrimitiveKind::Null))
        return a;

    const bool unions = mode == Mode::Strict && policy == UnionPolicy::Allow;

    if (a.is_union() || b.is_union())
    {
        if (!unions)
            return conflict(a, b);
        return synthesize_union({a, b});
    }

    if (a.is_primitive() && b.is_primitive())
        return unify_primitives(a, b, mode);

    if (a.is_array() && b.is_array())
    {
        auto item = unify_impl(a.item(), b.item(), mode, policy);
        if (!item)
            return item.error();
        TypeNode out = TypeNode::make_array(item.take());
        out.name = a.name.empty() ? b.name : a.name;
        return out;
    }

    if (a.is_record() && b.is_record())
    {
        auto merged = merge_records(a, b, mode);
        if (merged || !unions)
            return merged;
        return synthesize_union({a, b});
    }

    if ((a.is_record() || b.is_record()) && unions)
        return synthesize_union({a, b});

    return conflict(a, b);
}

Result<TypeNode> fold(const std::vector<TypeNode>& elements, Mode mode, UnionPolicy policy)
{
    TypeNode acc = TypeNode::make_primitive(PrimitiveKind::Null);
    for (const auto& el : elements)
    {
        auto next = unify_impl(acc, el, mode, policy);
        if (!next)
            return next.error();
        acc = next.take();
    }
    return acc;
}

TypeNode majority(const std::vector<TypeNode>& elements)
{
    std::unordered_map<std::string, std::size_t> counts;
    std::vector<std::pair<std::string, const TypeNode*>> order;
    for (const auto& el : elements)
    {
        if (el.is_primitive(PrimitiveKind::Null))
            continue;
        auto text = render_text(el);
        if (counts[text]++ == 0)
            order.emplace_back(text, &el);
    }
    if (order.empty())
        return TypeNode::make_primitive(PrimitiveKind::Null);

    // Strictly greater keeps the earliest type on ties.
    const TypeNode* best = order.front().second;
    std::size_t best_count = counts[order.front().first];
    for (const auto& [text, node] : order)
    {
        if (counts[text] > best_count)
        {
            best = node;
            best_count = counts[text];
        }
    }
    return *best;
}

} // namespace

Result<TypeNode> unify(const TypeNode& a, const TypeNode& b, Mode mode)
{
    return unify_impl(a, b, mode, UnionPolicy::Allow);
}

Result<TypeNode> unify_without_union(const TypeNode& a, const TypeNode& b, Mode mode)
{
    return unify_impl(a, b, mode, UnionPolicy::Forbid);
}

Result<TypeNode> resolve_items(const std::vector<TypeNode>& elements, Mode mode)
{
    auto folded = fold(elements, Mode::Strict, UnionPolicy::Forbid);
    if (folded)
        return folded;

    if (mode == Mode::Lenient)
        return majority(elements);

    // All elements go to the synthesizer together so that it judges the
    // candidate set as a whole.
    bool has_record = std::any_of(elements.begin(), elements.end(), [](const TypeNode& t)
                                  { return t.is_record() || t.is_union(); });
    if (!has_record)
        return folded;
    return synthesize_union(elements);
}

bool same_shape(const TypeNode& a, const TypeNode& b)
{
    if (a.kind != b.kind)
        return false;
    switch (a.kind)
    {
    case TypeNode::Kind::Primitive:
        return a.primitive == b.primitive || (is_numeric(a.primitive) && is_numeric(b.primitive));
    case TypeNode::Kind::Array:
        return a.name == b.name && same_shape(a.item(), b.item());
    case TypeNode::Kind::Union:
        if (a.children.size() != b.children.size())
            return false;
        for (std::size_t i = 0; i < a.children.size(); ++i)
        {
            if (a.children[i].branch_key() != b.children[i].branch_key() ||
                !same_shape(a.children[i], b.children[i]))
                return false;
        }
        return true;
    case TypeNode::Kind::Record:
        break;
    }
    if (a.name != b.name || a.fields.size() != b.fields.size())
        return false;
    for (std::size_t i = 0; i < a.fields.size(); ++i)
    {
        if (a.fields[i].name != b.fields[i].name || !same_shape(a.fields[i].type, b.fields[i].type))
            return false;
    }
    return true;
}

} // namespace avroinfer::schema

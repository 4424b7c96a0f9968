#include "avroinfer/schema/union_synth.hpp"
#include "avroinfer/schema/unifier.hpp"

#include <algorithm>
#include <optional>
#include <utility>

namespace avroinfer::schema
{
namespace
{

// {"long": 12} or {"array": [...]} is how Avro JSON writes a union value;
// such a record stands for the branch its key names.
std::optional<TypeNode> encoded_branch(const TypeNode& candidate)
{
    if (!candidate.is_record() || candidate.fields.size() != 1)
        return std::nullopt;

    const Field& only = candidate.fields.front();
    if (only.name == "array")
    {
        if (!only.type.is_array())
            return std::nullopt;
        TypeNode branch = only.type;
        branch.name = "array";
        return branch;
    }

    PrimitiveKind kind;
    if (!primitive_from_keyword(only.name, kind) || !only.type.is_primitive())
        return std::nullopt;
    auto target = TypeNode::make_primitive(kind);
    auto widened = unify_without_union(only.type, target, Mode::Strict);
    if (!widened || widened.value() != target)
        return std::nullopt;
    return target;
}

class BranchSet
{
  public:
    // A bare null is neutral; an encoded {"null": null} is a branch of its own.
    Result<bool> add(TypeNode branch, bool keep_null)
    {
        if (branch.is_primitive(PrimitiveKind::Null) && !keep_null)
            return true;

        const std::string key = branch.branch_key();
        auto it = std::find_if(branches_.begin(), branches_.end(),
                               [&](const TypeNode& b) { return b.branch_key() == key; });
        if (it == branches_.end())
        {
            branches_.push_back(std::move(branch));
            return true;
        }

        auto merged = unify_without_union(*it, branch, Mode::Strict);
        if (!merged)
            return make_error(ErrorKind::InvalidStructure,
                              "union branch '" + key + "' cannot absorb a second shape: " +
                                  merged.error().message);
        *it = merged.take();
        return true;
    }

    std::vector<TypeNode>& branches()
    {
        return branches_;
    }

  private:
    std::vector<TypeNode> branches_;
};

} // namespace

Result<TypeNode> synthesize_union(const std::vector<TypeNode>& candidates)
{
    bool record_shaped = std::any_of(candidates.begin(), candidates.end(), [](const TypeNode& c)
                                     { return c.is_record() || c.is_union(); });
    if (!record_shaped)
        return make_error(ErrorKind::TypeConflict,
                          "no record among the conflicting types, a union does not apply");

    std::size_t encoded = 0;
    std::size_t plain = 0;
    std::vector<std::pair<TypeNode, bool>> unwrapped;
    unwrapped.reserve(candidates.size());
    for (const auto& candidate : candidates)
    {
        if (candidate.is_union())
        {
            // A union holding a record branch was built from plain records;
            // any other union was built from encoded values.
            bool has_record = std::any_of(candidate.children.begin(), candidate.children.end(),
                                          [](const TypeNode& b) { return b.is_record(); });
            ++(has_record ? plain : encoded);
            for (const auto& branch : candidate.children)
                unwrapped.emplace_back(branch, true);
            continue;
        }
        if (auto branch = encoded_branch(candidate))
        {
            ++encoded;
            unwrapped.emplace_back(std::move(*branch), true);
            continue;
        }
        if (candidate.is_record())
            ++plain;
        unwrapped.emplace_back(candidate, false);
    }
    if (encoded > 0 && plain > 0)
        return make_error(ErrorKind::InvalidStructure,
                          "records mix encoded union values with plain records");

    BranchSet set;
    for (auto& [branch, keep_null] : unwrapped)
    {
        auto added = set.add(std::move(branch), keep_null);
        if (!added)
            return added.error();
    }

    auto& branches = set.branches();
    if (branches.empty())
        return TypeNode::make_primitive(PrimitiveKind::Null);
    // Encoded values only read back through a union, even a single-branch one.
    if (branches.size() == 1 && encoded == 0)
        return std::move(branches.front());
    return TypeNode::make_union(std::move(branches));
}

} // namespace avroinfer::schema

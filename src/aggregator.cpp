#include "avroinfer/aggregator.hpp"
#include "avroinfer/derive.hpp"
#include "avroinfer/schema/renderer.hpp"
#include "avroinfer/schema/unifier.hpp"

#include <algorithm>
#include <future>
#include <iterator>
#include <unordered_map>
#include <utility>

namespace avroinfer
{

OrderedJson MatchGroup::to_json() const
{
    OrderedJson out = OrderedJson::object();
    out["schema"] = schema::render(type);
    out["messagesMatched"] = messages;
    out["numMessagesMatched"] = messages.size();
    return out;
}

Aggregator::Aggregator(DeriveOptions options)
    : options_(std::move(options)), logger_("avroinfer.aggregator", options_.log_level,
                                            options_.log_sink)
{
}

std::vector<Result<schema::TypeNode>> Aggregator::derive_all(
    const std::vector<Result<ParsedValue>>& documents) const
{
    auto derive_one = [this, &documents](std::size_t i) -> Result<schema::TypeNode>
    {
        const auto& doc = documents[i];
        if (!doc)
            return doc.error();
        return try_derive_type(doc.value(), options_.record_name, options_);
    };

    std::vector<Result<schema::TypeNode>> results;
    results.reserve(documents.size());

    const std::size_t workers = std::min(options_.workers, documents.size());
    if (workers <= 1)
    {
        for (std::size_t i = 0; i < documents.size(); ++i)
            results.push_back(derive_one(i));
        return results;
    }

    // Each worker takes a contiguous slice; results keep their source index.
    std::vector<std::future<std::vector<Result<schema::TypeNode>>>> slices;
    const std::size_t per_worker = (documents.size() + workers - 1) / workers;
    for (std::size_t begin = 0; begin < documents.size(); begin += per_worker)
    {
        std::size_t end = std::min(begin + per_worker, documents.size());
        slices.push_back(std::async(std::launch::async,
                                    [begin, end, &derive_one]
                                    {
                                        std::vector<Result<schema::TypeNode>> part;
                                        part.reserve(end - begin);
                                        for (std::size_t i = begin; i < end; ++i)
                                            part.push_back(derive_one(i));
                                        return part;
                                    }));
    }
    for (auto& slice : slices)
    {
        auto part = slice.get();
        std::move(part.begin(), part.end(), std::back_inserter(results));
    }
    return results;
}

std::vector<MatchGroup> Aggregator::rank(const std::vector<Result<ParsedValue>>& documents) const
{
    auto derived = derive_all(documents);

    std::vector<MatchGroup> groups;
    std::unordered_map<std::string, std::size_t> by_text;
    for (std::size_t i = 0; i < derived.size(); ++i)
    {
        auto& result = derived[i];
        if (!result)
        {
            logger_.warning("message " + std::to_string(i) + " unmatched: " +
                            to_string(result.error().kind) + ": " + result.error().message);
            continue;
        }
        auto text = schema::render_text(result.value());
        logger_.debug("message " + std::to_string(i) + " -> " + text);
        auto [it, inserted] = by_text.emplace(text, groups.size());
        if (inserted)
            groups.push_back(MatchGroup{result.take(), std::move(text), {}});
        groups[it->second].messages.push_back(i);
    }

    // Fold groups that only differ by numeric widening into the wider schema.
    std::vector<MatchGroup> folded;
    for (auto& group : groups)
    {
        auto target = std::find_if(folded.begin(), folded.end(), [&](const MatchGroup& f)
                                   { return schema::same_shape(f.type, group.type); });
        if (target == folded.end())
        {
            folded.push_back(std::move(group));
            continue;
        }
        auto widened = schema::unify_without_union(target->type, group.type, options_.mode);
        if (!widened)
        {
            folded.push_back(std::move(group));
            continue;
        }
        target->type = widened.take();
        target->text = schema::render_text(target->type);
        std::vector<std::size_t> members;
        std::merge(target->messages.begin(), target->messages.end(), group.messages.begin(),
                   group.messages.end(), std::back_inserter(members));
        target->messages = std::move(members);
    }

    std::stable_sort(folded.begin(), folded.end(), [](const MatchGroup& a, const MatchGroup& b)
                     {
                         if (a.count() != b.count())
                             return a.count() > b.count();
                         return a.earliest() < b.earliest();
                     });
    return folded;
}

Result<std::vector<OrderedJson>> Aggregator::try_aggregate(
    const std::vector<Result<ParsedValue>>& documents) const
{
    auto groups = rank(documents);
    logger_.info("derived " + std::to_string(groups.size()) + " distinct schema(s) from " +
                 std::to_string(documents.size()) + " message(s), mode " +
                 to_string(options_.mode));
    if (groups.empty())
        return make_error(ErrorKind::NoSchemaDerived,
                          "no schema could be derived from any of the " +
                              std::to_string(documents.size()) + " message(s)");

    std::vector<OrderedJson> out;
    if (options_.mode == Mode::Lenient)
    {
        OrderedJson top = OrderedJson::object();
        top["schema"] = schema::render(groups.front().type);
        out.push_back(std::move(top));
        return out;
    }

    const std::size_t limit = std::min(std::max<std::size_t>(options_.max_groups, 1), groups.size());
    for (std::size_t i = 0; i < limit; ++i)
        out.push_back(groups[i].to_json());
    return out;
}

std::vector<OrderedJson> derive_multiple(const std::vector<std::string>& messages,
                                         const DeriveOptions& options)
{
    std::vector<Result<ParsedValue>> documents;
    documents.reserve(messages.size());
    for (const auto& text : messages)
        documents.push_back(try_parse_document(text, options.max_depth));
    return unwrap(Aggregator(options).try_aggregate(documents));
}

std::vector<OrderedJson> derive_multiple(const std::vector<ParsedValue>& messages,
                                         const DeriveOptions& options)
{
    std::vector<Result<ParsedValue>> documents(messages.begin(), messages.end());
    return unwrap(Aggregator(options).try_aggregate(documents));
}

} // namespace avroinfer

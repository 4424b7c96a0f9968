#pragma once
#include "avroinfer/logging.hpp"
#include "avroinfer/result.hpp"
#include "avroinfer/schema/type_node.hpp"
#include "avroinfer/settings.hpp"
#include "avroinfer/types.hpp"
#include "avroinfer/value.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace avroinfer
{

/// Documents that produced one schema.
struct MatchGroup
{
    schema::TypeNode type;
    std::string text;                  ///< Rendered schema text, the grouping key
    std::vector<std::size_t> messages; ///< Source indices, ascending

    std::size_t count() const
    {
        return messages.size();
    }

    std::size_t earliest() const
    {
        return messages.front();
    }

    /// {"schema":...,"messagesMatched":[...],"numMessagesMatched":N}
    OrderedJson to_json() const;
};

/// Derives a schema per document of a batch and ranks the distinct results.
///
/// A document that fails to derive is only "unmatched"; it never aborts the
/// batch. Groups rank by member count descending, then by earliest member.
class Aggregator
{
  public:
    explicit Aggregator(DeriveOptions options);

    /// Ranked groups of every distinct schema, after folding together groups
    /// that differ only by numeric widening. Empty when nothing derived.
    std::vector<MatchGroup> rank(const std::vector<Result<ParsedValue>>& documents) const;

    /// Strict: up to max_groups entries (at least one) with match metadata.
    /// Lenient: a single {"schema":...} entry for the top group.
    /// Fails with ErrorKind::NoSchemaDerived when no document derived.
    Result<std::vector<OrderedJson>> try_aggregate(
        const std::vector<Result<ParsedValue>>& documents) const;

    const DeriveOptions& options() const
    {
        return options_;
    }

  private:
    std::vector<Result<schema::TypeNode>> derive_all(
        const std::vector<Result<ParsedValue>>& documents) const;

    DeriveOptions options_;
    Logger logger_;
};

/// Batch derivation over document texts; unparsable texts are unmatched.
std::vector<OrderedJson> derive_multiple(const std::vector<std::string>& messages,
                                         const DeriveOptions& options);

/// Batch derivation over parsed documents.
std::vector<OrderedJson> derive_multiple(const std::vector<ParsedValue>& messages,
                                         const DeriveOptions& options);

} // namespace avroinfer

#pragma once
#include "avroinfer/result.hpp"
#include "avroinfer/schema/type_node.hpp"
#include "avroinfer/settings.hpp"
#include "avroinfer/types.hpp"
#include "avroinfer/value.hpp"

#include <string>

namespace avroinfer
{

/// Derive the record type of one document. The top-level value must be a
/// mapping; it becomes a record called `record_name`.
Result<schema::TypeNode> try_derive_type(const ParsedValue& document,
                                         const std::string& record_name,
                                         const DeriveOptions& options);

/// Rendered schema of one document, or the failure that prevented it.
Result<OrderedJson> try_derive_schema(const ParsedValue& document, const std::string& record_name,
                                      const DeriveOptions& options);

/// Throwing entry points. Errors surface as the DeriveFailure subclass that
/// matches their ErrorKind.
OrderedJson derive_schema(const ParsedValue& document, const std::string& record_name,
                          const DeriveOptions& options);
OrderedJson derive_schema(const Json& document, const std::string& record_name,
                          const DeriveOptions& options);
OrderedJson derive_schema(const Json& document, const std::string& record_name, Mode mode);

/// Parse `text` and derive its schema.
OrderedJson derive_schema_from_text(const std::string& text, const std::string& record_name,
                                    const DeriveOptions& options);

} // namespace avroinfer

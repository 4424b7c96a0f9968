#include "avroinfer/derive.hpp"
#include "avroinfer/schema/merger.hpp"
#include "avroinfer/schema/renderer.hpp"

namespace avroinfer
{

Result<schema::TypeNode> try_derive_type(const ParsedValue& document,
                                         const std::string& record_name,
                                         const DeriveOptions& options)
{
    if (!document.is_object())
        return make_error(ErrorKind::InvalidStructure,
                          "a document must be a JSON object to derive a record schema");

    schema::StructuralMerger merger(options.mode, options.max_depth);
    return merger.build_record(document.as_object(), record_name);
}

Result<OrderedJson> try_derive_schema(const ParsedValue& document, const std::string& record_name,
                                      const DeriveOptions& options)
{
    auto type = try_derive_type(document, record_name, options);
    if (!type)
        return type.error();
    return schema::render(type.value());
}

OrderedJson derive_schema(const ParsedValue& document, const std::string& record_name,
                          const DeriveOptions& options)
{
    return unwrap(try_derive_schema(document, record_name, options));
}

OrderedJson derive_schema(const Json& document, const std::string& record_name,
                          const DeriveOptions& options)
{
    return derive_schema(from_json(document, options.max_depth), record_name, options);
}

OrderedJson derive_schema(const Json& document, const std::string& record_name, Mode mode)
{
    DeriveOptions options;
    options.mode = mode;
    return derive_schema(document, record_name, options);
}

OrderedJson derive_schema_from_text(const std::string& text, const std::string& record_name,
                                    const DeriveOptions& options)
{
    return derive_schema(parse_document(text, options.max_depth), record_name, options);
}

} // namespace avroinfer

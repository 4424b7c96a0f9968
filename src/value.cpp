#include "avroinfer/value.hpp"

#include <optional>
#include <string>
#include <utility>

namespace avroinfer
{
namespace
{

bool lexeme_is_integral(const std::string& s)
{
    return s.find_first_of(".eE") == std::string::npos;
}

/// Builds a ParsedValue tree from nlohmann SAX events without recursion.
class TreeBuilder
{
  public:
    using number_integer_t = Json::number_integer_t;
    using number_unsigned_t = Json::number_unsigned_t;
    using number_float_t = Json::number_float_t;
    using string_t = Json::string_t;
    using binary_t = Json::binary_t;

    explicit TreeBuilder(std::size_t max_depth) : max_depth_(max_depth) {}

    bool null()
    {
        return handle(ParsedValue(nullptr));
    }

    bool boolean(bool val)
    {
        return handle(ParsedValue(val));
    }

    bool number_integer(number_integer_t val)
    {
        return handle(ParsedValue(Number{std::to_string(val), true}));
    }

    bool number_unsigned(number_unsigned_t val)
    {
        return handle(ParsedValue(Number{std::to_string(val), true}));
    }

    // Integral literals too wide for 64 bits arrive here too; the raw text
    // keeps them recognizable as integral.
    bool number_float(number_float_t, const string_t& s)
    {
        return handle(ParsedValue(Number{s, lexeme_is_integral(s)}));
    }

    bool string(string_t& val)
    {
        return handle(ParsedValue(std::move(val)));
    }

    bool binary(binary_t&)
    {
        error_ = make_error(ErrorKind::Parse, "binary values are not JSON");
        return false;
    }

    bool start_object(std::size_t)
    {
        return open(ParsedValue(ParsedValue::object_t{}));
    }

    bool key(string_t& val)
    {
        key_ = std::move(val);
        return true;
    }

    bool end_object()
    {
        stack_.pop_back();
        return true;
    }

    bool start_array(std::size_t)
    {
        return open(ParsedValue(ParsedValue::array_t{}));
    }

    bool end_array()
    {
        stack_.pop_back();
        return true;
    }

    bool parse_error(std::size_t position, const std::string&, const nlohmann::detail::exception& ex)
    {
        error_ = make_error(ErrorKind::Parse, "invalid JSON at byte " + std::to_string(position) +
                                                  ": " + ex.what());
        return false;
    }

    Result<ParsedValue> finish(bool accepted)
    {
        if (error_)
            return *error_;
        if (!accepted)
            return make_error(ErrorKind::Parse, "invalid JSON document");
        return std::move(root_);
    }

  private:
    bool open(ParsedValue container)
    {
        if (stack_.size() >= max_depth_)
        {
            error_ = make_error(ErrorKind::DepthLimit,
                                "nesting exceeds " + std::to_string(max_depth_) + " levels");
            return false;
        }
        ParsedValue* slot = place(std::move(container));
        stack_.push_back(slot);
        return true;
    }

    bool handle(ParsedValue v)
    {
        place(std::move(v));
        return true;
    }

    // Store v at the current position and return where it landed. Pointers on
    // the stack stay valid because only the innermost container grows.
    ParsedValue* place(ParsedValue v)
    {
        if (stack_.empty())
        {
            root_ = std::move(v);
            return &root_;
        }
        auto& top = stack_.back()->value;
        if (auto* arr = std::get_if<ParsedValue::array_t>(&top))
        {
            arr->push_back(std::move(v));
            return &arr->back();
        }
        auto& obj = std::get<ParsedValue::object_t>(top);
        for (auto& member : obj)
        {
            if (member.first == key_)
            {
                member.second = std::move(v);
                return &member.second;
            }
        }
        obj.emplace_back(std::move(key_), std::move(v));
        return &obj.back().second;
    }

    std::size_t max_depth_;
    ParsedValue root_;
    std::vector<ParsedValue*> stack_;
    std::string key_;
    std::optional<DeriveError> error_;
};

Result<ParsedValue> convert(const Json& j, std::size_t depth, std::size_t max_depth)
{
    switch (j.type())
    {
    case Json::value_t::null:
    case Json::value_t::discarded:
        return ParsedValue(nullptr);
    case Json::value_t::boolean:
        return ParsedValue(j.get<bool>());
    case Json::value_t::number_integer:
        return ParsedValue(Number{std::to_string(j.get<Json::number_integer_t>()), true});
    case Json::value_t::number_unsigned:
        return ParsedValue(Number{std::to_string(j.get<Json::number_unsigned_t>()), true});
    case Json::value_t::number_float:
        return ParsedValue(Number{j.dump(), false});
    case Json::value_t::string:
        return ParsedValue(j.get<std::string>());
    case Json::value_t::binary:
        return make_error(ErrorKind::Parse, "binary values are not JSON");
    case Json::value_t::array:
    case Json::value_t::object:
        break;
    }

    if (depth >= max_depth)
        return make_error(ErrorKind::DepthLimit,
                          "nesting exceeds " + std::to_string(max_depth) + " levels");

    if (j.is_array())
    {
        ParsedValue::array_t out;
        out.reserve(j.size());
        for (const auto& el : j)
        {
            auto child = convert(el, depth + 1, max_depth);
            if (!child)
                return child.error();
            out.push_back(child.take());
        }
        return ParsedValue(std::move(out));
    }

    ParsedValue::object_t out;
    out.reserve(j.size());
    for (auto it = j.begin(); it != j.end(); ++it)
    {
        auto child = convert(it.value(), depth + 1, max_depth);
        if (!child)
            return child.error();
        out.emplace_back(it.key(), child.take());
    }
    return ParsedValue(std::move(out));
}

} // namespace

Result<ParsedValue> try_parse_document(const std::string& text, std::size_t max_depth)
{
    TreeBuilder builder(max_depth);
    bool accepted = Json::sax_parse(text, &builder);
    return builder.finish(accepted);
}

ParsedValue parse_document(const std::string& text, std::size_t max_depth)
{
    return unwrap(try_parse_document(text, max_depth));
}

Result<ParsedValue> try_from_json(const Json& j, std::size_t max_depth)
{
    return convert(j, 0, max_depth);
}

ParsedValue from_json(const Json& j, std::size_t max_depth)
{
    return unwrap(try_from_json(j, max_depth));
}

std::vector<ParsedValue> read_messages(const std::string& text, std::size_t max_depth)
{
    auto doc = parse_document(text, max_depth);
    if (!doc.is_array())
    {
        std::vector<ParsedValue> one;
        one.push_back(std::move(doc));
        return one;
    }
    return std::get<ParsedValue::array_t>(std::move(doc.value));
}

} // namespace avroinfer

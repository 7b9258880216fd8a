#include <treediff/encodings/json.h>

#include <algorithm>
#include <cmath>
#include <mutex>
#include <vector>

#include <nlohmann/json.hpp>
#include <simdjson.h>

#include <treediff/core/datetime.h>
#include <treediff/utilities/text.h>

namespace treediff {

// JSON I/O

// Read a JSON value into a dynamic.
static dynamic
read_json_value(simdjson::dom::element const& json)
{
    switch (json.type())
    {
        case simdjson::dom::element_type::NULL_VALUE:
        default: // to avoid warnings
            return nil;
        case simdjson::dom::element_type::BOOL:
            return bool(json);
        case simdjson::dom::element_type::INT64:
            return double(int64_t(json));
        case simdjson::dom::element_type::UINT64:
            return double(uint64_t(json));
        case simdjson::dom::element_type::DOUBLE:
            return double(json);
        case simdjson::dom::element_type::STRING:
            return string(json.get_string().value());
        case simdjson::dom::element_type::ARRAY: {
            simdjson::dom::array source = json;
            dynamic_array array;
            array.reserve(source.size());
            for (auto const& i : source)
            {
                array.push_back(read_json_value(i));
            }
            return array;
        }
        case simdjson::dom::element_type::OBJECT: {
            simdjson::dom::object object = json;
            dynamic_map map;
            for (auto const& i : object)
            {
                map[string(i.key)] = read_json_value(i.value);
            }
            return map;
        }
    }
}

dynamic
parse_json_value(char const* json, size_t length)
{
    static simdjson::dom::parser the_parser;
    static std::mutex the_mutex;

    std::lock_guard<std::mutex> guard(the_mutex);

    simdjson::dom::element doc;
    try
    {
        doc = the_parser.parse(json, length);
    }
    catch (std::exception& e)
    {
        TREEDIFF_THROW(
            parsing_error() << expected_format_info("JSON")
                            << parsed_text_info(string(json, json + length))
                            << parsing_error_info(e.what()));
    }
    return read_json_value(doc);
}

static nlohmann::json
number_to_json(double d)
{
    if (!std::isfinite(d))
        return nullptr;
    // Whole numbers are written without a fractional part.
    if (d == std::floor(d) && std::fabs(d) < 9.0e15)
        return static_cast<integer>(d);
    return d;
}

namespace {

struct json_writer
{
    // containers currently being written, innermost last
    std::vector<void const*> stack;

    nlohmann::json
    write(dynamic const& v)
    {
        switch (v.type())
        {
            case value_type::NIL:
            default: // to avoid warnings
                return nullptr;
            case value_type::BOOLEAN:
                return cast<bool>(v);
            case value_type::NUMBER:
                return number_to_json(cast<double>(v));
            case value_type::STRING:
                return cast<string>(v);
            case value_type::DATETIME:
                return to_value_string(cast<ptime>(v));
            case value_type::PATTERN:
                return to_string(cast<pattern>(v));
            case value_type::ARRAY:
            case value_type::MAP:
                return write_container(v);
        }
    }

    nlohmann::json
    write_container(dynamic const& v)
    {
        auto id = container_id(v);
        if (std::find(stack.begin(), stack.end(), id) != stack.end())
            TREEDIFF_THROW(cyclic_value());
        stack.push_back(id);
        nlohmann::json json;
        if (v.type() == value_type::ARRAY)
        {
            json = nlohmann::json(nlohmann::json::value_t::array);
            for (auto const& i : cast<dynamic_array>(v))
            {
                json.push_back(write(i));
            }
        }
        else
        {
            json = nlohmann::json(nlohmann::json::value_t::object);
            for (auto const& i : cast<dynamic_map>(v))
            {
                json[i.first] = write(i.second);
            }
        }
        stack.pop_back();
        return json;
    }
};

} // namespace

string
value_to_json(dynamic const& v, int indent)
{
    json_writer writer;
    auto json = writer.write(v);
    return json.dump(indent);
}

} // namespace treediff

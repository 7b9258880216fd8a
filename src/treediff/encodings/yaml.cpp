#include <treediff/encodings/yaml.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>
#include <vector>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/lexical_cast.hpp>

#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <yaml-cpp/yaml.h>
#pragma GCC diagnostic pop
#else
#include <yaml-cpp/yaml.h>
#endif

#include <treediff/core/datetime.h>
#include <treediff/utilities/text.h>

namespace treediff {

// YAML I/O

static bool
safe_isdigit(char ch)
{
    return std::isdigit(static_cast<unsigned char>(ch));
}

static optional<ptime>
read_quoted_time(string const& s)
{
    // First check if it looks anything like a time string.
    if (s.length() > 16 && safe_isdigit(s[0]) && safe_isdigit(s[1])
        && safe_isdigit(s[2]) && safe_isdigit(s[3]) && s[4] == '-')
    {
        try
        {
            auto t = parse_ptime(s);
            // Check that it can be converted back without changing its value.
            // This could be necessary if we actually expected a string here.
            if (to_value_string(t) == s)
                return t;
        }
        catch (parsing_error&)
        {
        }
    }
    return none;
}

// Interpret an unquoted scalar.
static dynamic
read_plain_scalar(string const& s)
{
    if (s == "true")
        return true;
    if (s == "false")
        return false;
    if (s == ".nan" || s == ".NaN" || s == ".NAN")
        return std::numeric_limits<double>::quiet_NaN();
    if (s == ".inf" || s == "+.inf" || s == ".Inf")
        return std::numeric_limits<double>::infinity();
    if (s == "-.inf" || s == "-.Inf")
        return -std::numeric_limits<double>::infinity();
    if (!s.compare(0, 2, "0x"))
    {
        std::istringstream stream(s.substr(2));
        integer i;
        stream >> std::hex >> i;
        if (!stream.fail() && stream.tellg() == std::streampos(-1))
            return i;
    }
    if (!s.compare(0, 2, "0o"))
    {
        std::istringstream stream(s.substr(2));
        integer i;
        stream >> std::oct >> i;
        if (!stream.fail() && stream.tellg() == std::streampos(-1))
            return i;
    }
    {
        integer i;
        if (boost::conversion::try_lexical_convert(s, i))
            return i;
    }
    {
        double d;
        if (boost::conversion::try_lexical_convert(s, d))
            return d;
    }
    // If all else fails, it must just be a string.
    return s;
}

// Read a YAML value into a dynamic.
static dynamic
read_yaml_value(YAML::Node const& yaml)
{
    switch (yaml.Type())
    {
        case YAML::NodeType::Null:
        default: // to avoid warnings
            return nil;
        case YAML::NodeType::Scalar: {
            auto s = yaml.as<string>();
            // Times are encoded as quoted strings, so a quoted string that
            // parses as a time is assumed to be one.
            if (yaml.Tag() == "!")
            {
                auto t = read_quoted_time(s);
                if (t)
                    return *t;
                return s;
            }
            return read_plain_scalar(s);
        }
        case YAML::NodeType::Sequence: {
            dynamic_array array;
            array.reserve(yaml.size());
            for (auto const& i : yaml)
            {
                array.push_back(read_yaml_value(i));
            }
            return array;
        }
        case YAML::NodeType::Map: {
            dynamic_map map;
            for (YAML::Node::const_iterator i = yaml.begin(); i != yaml.end();
                 ++i)
            {
                if (!i->first.IsScalar())
                {
                    YAML::Emitter out;
                    out << i->first;
                    TREEDIFF_THROW(
                        parsing_error()
                        << expected_format_info("YAML map key")
                        << parsed_text_info(string(out.c_str(), out.size()))
                        << parsing_error_info("map keys must be scalars"));
                }
                map[i->first.as<string>()] = read_yaml_value(i->second);
            }
            return map;
        }
    }
}

dynamic
parse_yaml_value(char const* yaml, size_t length)
{
    YAML::Node parsed_yaml;
    try
    {
        parsed_yaml = YAML::Load(string(yaml, yaml + length));
    }
    catch (std::exception& e)
    {
        TREEDIFF_THROW(
            parsing_error() << expected_format_info("YAML")
                            << parsed_text_info(string(yaml, yaml + length))
                            << parsing_error_info(e.what()));
    }
    return read_yaml_value(parsed_yaml);
}

// Would :s read back as something other than the same string if it were
// written unquoted?
static bool
needs_quotes(string const& s)
{
    if (s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL")
        return true;
    auto v = read_plain_scalar(s);
    return v.type() != value_type::STRING;
}

static void
emit_string(YAML::Emitter& out, string const& s)
{
    if (needs_quotes(s))
        out << YAML::DoubleQuoted << s;
    else
        out << s;
}

static void
emit_number(YAML::Emitter& out, double d)
{
    // Whole numbers are written without a fractional part.
    if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 9.0e15)
        out << static_cast<integer>(d);
    else
        out << d;
}

namespace {

struct yaml_emitter
{
    YAML::Emitter& out;
    bool diagnostic;
    // containers currently being emitted, innermost last
    std::vector<void const*> stack;

    void
    emit(dynamic const& v)
    {
        switch (v.type())
        {
            case value_type::NIL:
            default: // to avoid warnings
                out << YAML::Node();
                break;
            case value_type::BOOLEAN:
                out << cast<bool>(v);
                break;
            case value_type::NUMBER:
                emit_number(out, cast<double>(v));
                break;
            case value_type::STRING:
                emit_string(out, cast<string>(v));
                break;
            case value_type::DATETIME:
                out << YAML::DoubleQuoted << to_value_string(cast<ptime>(v));
                break;
            case value_type::PATTERN:
                out << YAML::DoubleQuoted << to_string(cast<pattern>(v));
                break;
            case value_type::ARRAY:
            case value_type::MAP:
                emit_container(v);
                break;
        }
    }

    void
    emit_container(dynamic const& v)
    {
        auto id = container_id(v);
        if (std::find(stack.begin(), stack.end(), id) != stack.end())
        {
            if (!diagnostic)
                TREEDIFF_THROW(cyclic_value());
            out << "<cycle>";
            return;
        }
        stack.push_back(id);
        if (v.type() == value_type::ARRAY)
            emit_array(cast<dynamic_array>(v));
        else
            emit_map(cast<dynamic_map>(v));
        stack.pop_back();
    }

    void
    emit_array(dynamic_array const& array)
    {
        if (diagnostic && array.size() >= 64)
        {
            out << "<array - size: " + lexical_cast<string>(array.size())
                       + ">";
            return;
        }
        out << YAML::BeginSeq;
        for (auto const& i : array)
        {
            emit(i);
        }
        out << YAML::EndSeq;
    }

    void
    emit_map(dynamic_map const& map)
    {
        if (diagnostic && map.size() >= 64)
        {
            out << "<map - size: " + lexical_cast<string>(map.size()) + ">";
            return;
        }
        out << YAML::BeginMap;
        for (auto const& i : map)
        {
            out << YAML::Key;
            emit_string(out, i.first);
            out << YAML::Value;
            emit(i.second);
        }
        out << YAML::EndMap;
    }
};

} // namespace

static string
emit_yaml(dynamic const& v, bool diagnostic)
{
    YAML::Emitter out;
    out << YAML::FloatPrecision(5);
    out << YAML::DoublePrecision(12);
    yaml_emitter emitter{out, diagnostic, {}};
    emitter.emit(v);
    return out.c_str();
}

string
value_to_yaml(dynamic const& v)
{
    return emit_yaml(v, false);
}

string
value_to_diagnostic_yaml(dynamic const& v)
{
    return emit_yaml(v, true);
}

} // namespace treediff

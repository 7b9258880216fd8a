#include <treediff/core/dynamic.h>

#include <algorithm>
#include <unordered_map>

#include <treediff/encodings/yaml.h>
#include <treediff/utilities/text.h>

namespace treediff {

std::ostream&
operator<<(std::ostream& s, value_type t)
{
    switch (t)
    {
        case value_type::NIL:
            s << "nil";
            break;
        case value_type::BOOLEAN:
            s << "boolean";
            break;
        case value_type::NUMBER:
            s << "number";
            break;
        case value_type::STRING:
            s << "string";
            break;
        case value_type::DATETIME:
            s << "datetime";
            break;
        case value_type::PATTERN:
            s << "pattern";
            break;
        case value_type::ARRAY:
            s << "array";
            break;
        case value_type::MAP:
            s << "map";
            break;
        default:
            TREEDIFF_THROW(
                invalid_enum_value()
                << enum_id_info("value_type") << enum_value_info(int(t)));
    }
    return s;
}

void
check_type(value_type expected, value_type actual)
{
    if (expected != actual)
    {
        TREEDIFF_THROW(
            type_mismatch() << expected_value_type_info(expected)
                            << actual_value_type_info(actual));
    }
}

dynamic::dynamic(std::initializer_list<dynamic> list)
{
    // If this is a list of arrays, all of which are length two and have
    // strings as their first elements, treat it as a map.
    if (list.size() != 0
        && std::all_of(list.begin(), list.end(), [](dynamic const& v) {
               return v.type() == value_type::ARRAY
                      && cast<dynamic_array>(v).size() == 2
                      && cast<dynamic_array>(v)[0].type()
                             == value_type::STRING;
           }))
    {
        dynamic_map map;
        for (auto const& v : list)
        {
            auto const& array = cast<dynamic_array>(v);
            map[cast<string>(array[0])] = array[1];
        }
        set(std::move(map));
    }
    else
    {
        set(dynamic_array(list));
    }
}

void
dynamic::set(nil_t _)
{
    type_ = value_type::NIL;
    value_.reset();
}
void
dynamic::set(bool v)
{
    type_ = value_type::BOOLEAN;
    value_ = v;
}
void
dynamic::set(double v)
{
    type_ = value_type::NUMBER;
    value_ = v;
}
void
dynamic::set(string const& v)
{
    type_ = value_type::STRING;
    value_ = v;
}
void
dynamic::set(string&& v)
{
    type_ = value_type::STRING;
    value_ = std::move(v);
}
void
dynamic::set(ptime const& v)
{
    type_ = value_type::DATETIME;
    value_ = v;
}
void
dynamic::set(pattern const& v)
{
    type_ = value_type::PATTERN;
    value_ = v;
}
void
dynamic::set(dynamic_array const& v)
{
    type_ = value_type::ARRAY;
    value_ = std::make_shared<dynamic_array>(v);
}
void
dynamic::set(dynamic_array&& v)
{
    type_ = value_type::ARRAY;
    value_ = std::make_shared<dynamic_array>(std::move(v));
}
void
dynamic::set(dynamic_map const& v)
{
    type_ = value_type::MAP;
    value_ = std::make_shared<dynamic_map>(v);
}
void
dynamic::set(dynamic_map&& v)
{
    type_ = value_type::MAP;
    value_ = std::make_shared<dynamic_map>(std::move(v));
}

void
swap(dynamic& a, dynamic& b)
{
    using std::swap;
    swap(a.type_, b.type_);
    swap(a.value_, b.value_);
}

std::ostream&
operator<<(std::ostream& os, dynamic const& v)
{
    os << value_to_diagnostic_yaml(v);
    return os;
}

std::ostream&
operator<<(std::ostream& os, std::list<dynamic> const& v)
{
    os << dynamic(dynamic_array(std::begin(v), std::end(v)));
    return os;
}

optional<value_type>
classify(dynamic const* v)
{
    if (!v)
        return none;
    return v->type();
}

void const*
container_id(dynamic const& v)
{
    switch (v.type())
    {
        case value_type::ARRAY:
            return &cast<dynamic_array>(v);
        case value_type::MAP:
            return &cast<dynamic_map>(v);
        default:
            return nullptr;
    }
}

namespace {

struct deep_copier
{
    // copies of the containers seen so far, by the id of the original
    std::unordered_map<void const*, dynamic> copies;

    dynamic
    copy(dynamic const& v)
    {
        if (!is_container(v.type()))
            return v;

        auto id = container_id(v);
        auto existing = copies.find(id);
        if (existing != copies.end())
            return existing->second;

        // Register the (empty) copy before filling it in so that cycles
        // resolve to it.
        if (v.type() == value_type::ARRAY)
        {
            dynamic result = dynamic_array();
            copies[id] = result;
            auto const& original = cast<dynamic_array>(v);
            auto& copied = cast<dynamic_array>(result);
            copied.reserve(original.size());
            for (auto const& item : original)
                copied.push_back(copy(item));
            return result;
        }
        else
        {
            dynamic result = dynamic_map();
            copies[id] = result;
            auto& copied = cast<dynamic_map>(result);
            for (auto const& field : cast<dynamic_map>(v))
                copied[field.first] = copy(field.second);
            return result;
        }
    }
};

} // namespace

dynamic
deep_copy(dynamic const& v)
{
    deep_copier copier;
    return copier.copy(v);
}

// COMPARISON OPERATORS

bool
operator==(dynamic const& a, dynamic const& b)
{
    if (a.type() != b.type())
        return false;
    switch (a.type())
    {
        case value_type::NIL:
        default:
            return true;
        case value_type::BOOLEAN:
            return cast<bool>(a) == cast<bool>(b);
        case value_type::NUMBER:
            return cast<double>(a) == cast<double>(b);
        case value_type::STRING:
            return cast<string>(a) == cast<string>(b);
        case value_type::DATETIME:
            return cast<ptime>(a) == cast<ptime>(b);
        case value_type::PATTERN:
            return cast<pattern>(a) == cast<pattern>(b);
        case value_type::ARRAY:
            return same_container(a, b)
                   || cast<dynamic_array>(a) == cast<dynamic_array>(b);
        case value_type::MAP:
            return same_container(a, b)
                   || cast<dynamic_map>(a) == cast<dynamic_map>(b);
    }
}
bool
operator!=(dynamic const& a, dynamic const& b)
{
    return !(a == b);
}

dynamic const&
get_field(dynamic_map const& r, string const& field)
{
    dynamic const* v;
    if (!get_field(&v, r, field))
    {
        TREEDIFF_THROW(missing_field() << field_name_info(field));
    }
    return *v;
}

dynamic&
get_field(dynamic_map& r, string const& field)
{
    dynamic* v;
    if (!get_field(&v, r, field))
    {
        TREEDIFF_THROW(missing_field() << field_name_info(field));
    }
    return *v;
}

bool
get_field(dynamic const** v, dynamic_map const& r, string const& field)
{
    auto i = r.find(field);
    if (i == r.end())
        return false;
    *v = &i->second;
    return true;
}

bool
get_field(dynamic** v, dynamic_map& r, string const& field)
{
    auto i = r.find(field);
    if (i == r.end())
        return false;
    *v = &i->second;
    return true;
}

void
add_dynamic_path_element(boost::exception& e, dynamic const& path_element)
{
    std::list<dynamic>* info = get_error_info<dynamic_value_path_info>(e);
    if (info)
    {
        info->push_front(path_element);
    }
    else
    {
        e << dynamic_value_path_info(std::list<dynamic>({path_element}));
    }
}

} // namespace treediff

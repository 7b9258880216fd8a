#ifndef TREEDIFF_CORE_DYNAMIC_H
#define TREEDIFF_CORE_DYNAMIC_H

#include <list>
#include <ostream>

#include <treediff/core/exception.h>
#include <treediff/core/type_definitions.h>

namespace treediff {

// DYNAMIC VALUES - Dynamic values are values whose structure is determined at
// run-time rather than compile time.

std::ostream&
operator<<(std::ostream& s, value_type t);

// Check that two value types match.
void
check_type(value_type expected, value_type actual);

// If the above check fails, it throws this exception.
TREEDIFF_DEFINE_EXCEPTION(type_mismatch)
TREEDIFF_DEFINE_ERROR_INFO(value_type, expected_value_type)
TREEDIFF_DEFINE_ERROR_INFO(value_type, actual_value_type)

// Get the value_type value for a C++ type.
template<class T>
struct value_type_of
{
};
template<>
struct value_type_of<nil_t>
{
    static value_type const value = value_type::NIL;
};
template<>
struct value_type_of<bool>
{
    static value_type const value = value_type::BOOLEAN;
};
template<>
struct value_type_of<double>
{
    static value_type const value = value_type::NUMBER;
};
template<>
struct value_type_of<string>
{
    static value_type const value = value_type::STRING;
};
template<>
struct value_type_of<ptime>
{
    static value_type const value = value_type::DATETIME;
};
template<>
struct value_type_of<pattern>
{
    static value_type const value = value_type::PATTERN;
};
template<>
struct value_type_of<dynamic_array>
{
    static value_type const value = value_type::ARRAY;
};
template<>
struct value_type_of<dynamic_map>
{
    static value_type const value = value_type::MAP;
};

// CLASSIFICATION

// Classify a value that may be absent. This is total: it returns none for an
// absent value and the value's type otherwise, and it never throws.
optional<value_type>
classify(dynamic const* v);

static inline optional<value_type>
classify(optional<dynamic> const& v)
{
    return classify(v.get_ptr());
}

// Is :t one of the container types (ARRAY or MAP)?
static inline bool
is_container(value_type t)
{
    return t == value_type::ARRAY || t == value_type::MAP;
}

// Get an opaque identifier for the container that :v refers to.
// Two dynamics that hold handles to the same container have the same id.
// For non-containers, this returns nullptr.
void const*
container_id(dynamic const& v);

// Do :a and :b refer to the same container?
static inline bool
same_container(dynamic const& a, dynamic const& b)
{
    auto id = container_id(a);
    return id != nullptr && id == container_id(b);
}

// cyclic_value is thrown when a value that contains itself is passed to an
// operation that only works on trees (e.g., encoding it as text).
TREEDIFF_DEFINE_EXCEPTION(cyclic_value)

// Make a copy of :v that shares no containers with :v.
// Sharing within :v (including cycles) is reproduced within the copy.
dynamic
deep_copy(dynamic const& v);

// MAPS

// This queries a map for a field with a key matching the given string.
// If the field is not present in the map, an exception is thrown.
dynamic const&
get_field(dynamic_map const& r, string const& field);
// non-const version
dynamic&
get_field(dynamic_map& r, string const& field);

TREEDIFF_DEFINE_EXCEPTION(missing_field)
TREEDIFF_DEFINE_ERROR_INFO(string, field_name)

// This is the same as above, but its return value indicates whether or not
// the field is in the map.
bool
get_field(dynamic const** v, dynamic_map const& r, string const& field);
// non-const version
bool
get_field(dynamic** v, dynamic_map& r, string const& field);

// When an error occurs in the processing of a dynamic value, this provides the
// path to the location within the value where the error occurred.
TREEDIFF_DEFINE_ERROR_INFO(std::list<dynamic>, dynamic_value_path)

// Given an exception :e, this will add :path_element to the beginning of the
// dynamic_value_path info associated with :e. If there is currently no path
// info associated with :e, a path containing only :p is associated with it.
void
add_dynamic_path_element(boost::exception& e, dynamic const& path_element);

// VALUES

namespace detail {

template<class T>
struct dynamic_storage
{
    static T const&
    get(std::any const& a)
    {
        return std::any_cast<T const&>(a);
    }
    static T&
    get(std::any& a)
    {
        return std::any_cast<T&>(a);
    }
};

template<class Container>
struct shared_dynamic_storage
{
    static Container const&
    get(std::any const& a)
    {
        return *std::any_cast<std::shared_ptr<Container> const&>(a);
    }
    static Container&
    get(std::any& a)
    {
        return *std::any_cast<std::shared_ptr<Container>&>(a);
    }
};

template<>
struct dynamic_storage<dynamic_array> : shared_dynamic_storage<dynamic_array>
{
};
template<>
struct dynamic_storage<dynamic_map> : shared_dynamic_storage<dynamic_map>
{
};

} // namespace detail

// Cast a dynamic value to one of the base types.
template<class T>
T const&
cast(dynamic const& v)
{
    check_type(value_type_of<T>::value, v.type());
    return detail::dynamic_storage<T>::get(v.contents());
}
// Same, but with a non-const reference.
// For arrays and maps, this is a reference to the shared container.
template<class T>
T&
cast(dynamic& v)
{
    check_type(value_type_of<T>::value, v.type());
    return detail::dynamic_storage<T>::get(v.contents());
}

std::ostream&
operator<<(std::ostream& os, dynamic const& v);

std::ostream&
operator<<(std::ostream& os, std::list<dynamic> const& v);

void
swap(dynamic& a, dynamic& b);

// Structural equality. This compares containers by contents, so it doesn't
// terminate on cyclic values. Numbers follow IEEE rules (NaN != NaN).
bool
operator==(dynamic const& a, dynamic const& b);
bool
operator!=(dynamic const& a, dynamic const& b);

// Apply the functor fn to the value v.
// fn must have the function call operator overloaded for all supported
// types (including nil). If it doesn't, you'll get a compile-time error.
template<class Fn>
auto
apply_to_dynamic(Fn&& fn, dynamic const& v)
{
    switch (v.type())
    {
        case value_type::NIL:
        default: // All cases are covered, so this is just to avoid warnings.
            return fn(nil);
        case value_type::BOOLEAN:
            return fn(cast<bool>(v));
        case value_type::NUMBER:
            return fn(cast<double>(v));
        case value_type::STRING:
            return fn(cast<string>(v));
        case value_type::DATETIME:
            return fn(cast<ptime>(v));
        case value_type::PATTERN:
            return fn(cast<pattern>(v));
        case value_type::ARRAY:
            return fn(cast<dynamic_array>(v));
        case value_type::MAP:
            return fn(cast<dynamic_map>(v));
    }
}

// This is a generic function for reading a field from a dynamic_map.
// Omitted fields are left untouched.
template<class Field>
void
read_optional_field(
    optional<Field>* field_value,
    dynamic_map const& record,
    string const& field_name)
{
    dynamic const* dynamic_field_value;
    if (!get_field(&dynamic_field_value, record, field_name))
        return;
    try
    {
        *field_value = cast<Field>(*dynamic_field_value);
    }
    catch (boost::exception& e)
    {
        treediff::add_dynamic_path_element(e, field_name);
        throw;
    }
}

} // namespace treediff

#endif

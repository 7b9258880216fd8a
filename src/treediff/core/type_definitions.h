#ifndef TREEDIFF_CORE_TYPE_DEFINITIONS_H
#define TREEDIFF_CORE_TYPE_DEFINITIONS_H

#include <any>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/optional.hpp>

#include <treediff/core/pattern.h>

namespace treediff {

using std::string;

using boost::none;
using boost::optional;

// some(x) creates a boost::optional of the proper type with the value of :x.
template<class T>
auto
some(T&& x)
{
    return optional<std::remove_cv_t<std::remove_reference_t<T>>>(
        std::forward<T>(x));
}

typedef int64_t integer;

using boost::posix_time::ptime;

// nil_t is a unit type. It has only one possible value, :nil.
struct nil_t
{
};
static nil_t nil;

struct dynamic;

enum class value_type
{
    NIL, // nil_t - no value
    BOOLEAN, // bool
    NUMBER, // double
    STRING, // string
    DATETIME, // boost::posix_time::ptime
    PATTERN, // pattern - compiled regular expression
    ARRAY, // dynamic_array - array of dynamic values
    MAP, // dynamic_map - collection of named dynamic values
};

// Arrays are represented as std::vectors and can be manipulated as such.
typedef std::vector<dynamic> dynamic_array;

// Maps are represented as std::maps and can be manipulated as such.
typedef std::map<string, dynamic> dynamic_map;

// A dynamic holds its scalars by value, but it holds arrays and maps through
// shared handles. Copying a dynamic that holds a container yields a second
// handle to the same container, so changes made through one are visible
// through the other, and a container can (directly or indirectly) contain
// itself. Use deep_copy() to get an independent value.
//
// Note that cyclic containers keep each other alive, so whoever builds a cycle
// must break it to release it.
struct dynamic
{
    // CONSTRUCTORS

    // Default construction creates a nil value.
    dynamic()
    {
        set(nil);
    }

    // Construct a dynamic from one of the base types.
    dynamic(nil_t v)
    {
        set(v);
    }
    dynamic(bool v)
    {
        set(v);
    }
    dynamic(double v)
    {
        set(v);
    }
    // All numbers are stored as doubles.
    dynamic(int v)
    {
        set(double(v));
    }
    dynamic(integer v)
    {
        set(double(v));
    }
    dynamic(std::size_t v)
    {
        set(double(v));
    }
    dynamic(string const& v)
    {
        set(v);
    }
    dynamic(string&& v)
    {
        set(std::move(v));
    }
    dynamic(char const* v)
    {
        set(string(v));
    }
    dynamic(ptime const& v)
    {
        set(v);
    }
    dynamic(pattern const& v)
    {
        set(v);
    }
    // Constructing from a container copies it into a fresh shared container.
    dynamic(dynamic_array const& v)
    {
        set(v);
    }
    dynamic(dynamic_array&& v)
    {
        set(std::move(v));
    }
    dynamic(dynamic_map const& v)
    {
        set(v);
    }
    dynamic(dynamic_map&& v)
    {
        set(std::move(v));
    }

    // Construct from an initializer list.
    dynamic(std::initializer_list<dynamic> list);

    // GETTERS

    // Get the type of value stored here.
    value_type
    type() const
    {
        return type_;
    }

    // Get the contents.
    // This should be used with caution. Arrays and maps are stored as
    // std::shared_ptrs to the container.
    // cast<T>(dynamic) provides a safer interface to this.
    std::any const&
    contents() const&
    {
        return value_;
    }

    // Get a non-const reference to the contents.
    // This should be used with caution.
    // cast<T>(dynamic) provides a safer interface to this.
    std::any&
    contents() &
    {
        return value_;
    }

 private:
    void
    set(nil_t _);
    void
    set(bool v);
    void
    set(double v);
    void
    set(string const& v);
    void
    set(string&& v);
    void
    set(ptime const& v);
    void
    set(pattern const& v);
    void
    set(dynamic_array const& v);
    void
    set(dynamic_array&& v);
    void
    set(dynamic_map const& v);
    void
    set(dynamic_map&& v);

    friend void
    swap(dynamic& a, dynamic& b);

    value_type type_;
    std::any value_;
};

} // namespace treediff

#endif

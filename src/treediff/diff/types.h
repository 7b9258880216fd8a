#ifndef TREEDIFF_DIFF_TYPES_H
#define TREEDIFF_DIFF_TYPES_H

#include <ostream>
#include <variant>
#include <vector>

#include <treediff/core/dynamic.h>

namespace treediff {

// path_element is one step along a path into a value.
// Strings represent map keys. Indices represent array positions.
typedef std::variant<string, size_t> path_element;

// property_path represents the path from the root of a value to the point
// where a change should be applied.
typedef std::vector<path_element> property_path;

static inline bool
is_index(path_element const& e)
{
    return std::holds_alternative<size_t>(e);
}

std::ostream&
operator<<(std::ostream& os, property_path const& path);

dynamic
to_dynamic(path_element const& e);

dynamic
to_dynamic(property_path const& path);

// A date marker list identifies the datetime leaves inside a record's values.
// Each path starts with the side it refers to ("lhs" or "rhs"), and within an
// array_change, it's further prefixed with "item".
typedef std::vector<property_path> date_marker_list;

// Get the paths to all datetime leaves within :v, each prefixed with
// :prefix. Containers that (directly or indirectly) contain themselves are
// only visited once along any path.
date_marker_list
collect_date_paths(dynamic const& v, property_path const& prefix);

// RECORDS

// value_edit - The value at the path exists on both sides but differs.
struct value_edit
{
    dynamic lhs, rhs;
};

// value_addition - The value at the path only exists on the rhs.
struct value_addition
{
    dynamic rhs;
};

// value_removal - The value at the path only exists on the lhs.
struct value_removal
{
    dynamic lhs;
};

// array_insertion - An element only present in the rhs array.
struct array_insertion
{
    dynamic rhs;
};

// array_deletion - An element only present in the lhs array.
struct array_deletion
{
    dynamic lhs;
};

typedef std::variant<array_insertion, array_deletion> array_item;

// array_change - The array at the path gained or lost the element at :index.
struct array_change
{
    size_t index;
    array_item item;
};

typedef std::variant<value_edit, value_addition, value_removal, array_change>
    value_change;

enum class value_diff_kind
{
    EDIT,
    ADDITION,
    REMOVAL,
    ARRAY_CHANGE
};

std::ostream&
operator<<(std::ostream& s, value_diff_kind kind);

// Get the single-character code that identifies :kind in serialized records
// (E, N, D or A).
char
get_kind_code(value_diff_kind kind);

struct value_diff_item
{
    // the path to the affected value - If this is omitted, the change
    // applies to the root. It's never empty.
    optional<property_path> path;

    value_change change;

    // If this is omitted, none of the record's values contain datetimes. It's
    // never empty.
    optional<date_marker_list> dates;
};

typedef std::vector<value_diff_item> value_diff;

// ERRORS

// The path (as a dynamic array) at which an error occurred.
TREEDIFF_DEFINE_ERROR_INFO(dynamic, diff_path)
// The path element that couldn't be followed.
TREEDIFF_DEFINE_ERROR_INFO(dynamic, path_element)
// The kind code of the record being processed.
TREEDIFF_DEFINE_ERROR_INFO(string, change_kind)
// The type of the value that was found where something else was expected.
TREEDIFF_DEFINE_ERROR_INFO(value_type, found_value_type)
// A description of what's wrong.
TREEDIFF_DEFINE_ERROR_INFO(string, diff_error_message)

// invalid_target is thrown when the target of a change isn't an array or map.
TREEDIFF_DEFINE_EXCEPTION(invalid_target)

// invalid_change is thrown when a serialized record is malformed.
TREEDIFF_DEFINE_EXCEPTION(invalid_change)

// empty_path is thrown when reverting a record that applies to the root.
TREEDIFF_DEFINE_EXCEPTION(empty_path)

// not_object is thrown when a path leads through a value that isn't a
// container.
TREEDIFF_DEFINE_EXCEPTION(not_object)

// invalid_path is thrown when a path element can't address its container
// (e.g., a map key applied to an array).
TREEDIFF_DEFINE_EXCEPTION(invalid_path)

value_diff_kind
get_kind(value_diff_item const& item);

// Is :item an array_change that deletes an element?
bool
is_array_deletion(value_diff_item const& item);

// The following construct records in their normal form. An empty :path is
// stored as an omitted one, and the date markers are computed from the
// values.

value_diff_item
make_value_edit(
    property_path const& path, dynamic const& lhs, dynamic const& rhs);

value_diff_item
make_value_addition(property_path const& path, dynamic const& rhs);

value_diff_item
make_value_removal(property_path const& path, dynamic const& lhs);

// The date markers of the element are hoisted onto the record and prefixed
// with "item".
value_diff_item
make_array_change(
    property_path const& path, size_t index, array_item const& item);

bool
operator==(value_edit const& a, value_edit const& b);
bool
operator!=(value_edit const& a, value_edit const& b);
bool
operator==(value_addition const& a, value_addition const& b);
bool
operator!=(value_addition const& a, value_addition const& b);
bool
operator==(value_removal const& a, value_removal const& b);
bool
operator!=(value_removal const& a, value_removal const& b);
bool
operator==(array_insertion const& a, array_insertion const& b);
bool
operator!=(array_insertion const& a, array_insertion const& b);
bool
operator==(array_deletion const& a, array_deletion const& b);
bool
operator!=(array_deletion const& a, array_deletion const& b);
bool
operator==(array_change const& a, array_change const& b);
bool
operator!=(array_change const& a, array_change const& b);
bool
operator==(value_diff_item const& a, value_diff_item const& b);
bool
operator!=(value_diff_item const& a, value_diff_item const& b);

std::ostream&
operator<<(std::ostream& os, value_diff_item const& item);

} // namespace treediff

#endif

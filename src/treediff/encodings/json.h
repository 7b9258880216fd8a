#ifndef TREEDIFF_ENCODINGS_JSON_H
#define TREEDIFF_ENCODINGS_JSON_H

#include <treediff/core/dynamic.h>

// JSON - conversion to and from JSON strings

namespace treediff {

// Parse some JSON text into a dynamic value.
// All numbers are read as doubles. Strings are always read as strings, even
// if they look like timestamps.
dynamic
parse_json_value(char const* json, size_t length);

// Same as above, but accepts a string.
static inline dynamic
parse_json_value(string const& json)
{
    return parse_json_value(json.c_str(), json.length());
}

// Write a value to a string in JSON format.
// Datetimes are written as strings in the form produced by to_value_string(),
// patterns as their canonical string form and non-finite numbers as null.
// :indent is the number of spaces per nesting level. If it's negative, the
// output is written on a single line.
// If :v is cyclic, this throws cyclic_value.
string
value_to_json(dynamic const& v, int indent = 4);

} // namespace treediff

#endif

#ifndef TREEDIFF_ENCODINGS_YAML_H
#define TREEDIFF_ENCODINGS_YAML_H

#include <treediff/core/dynamic.h>

// YAML - conversion to and from YAML strings

namespace treediff {

// Parse some YAML text into a dynamic value.
// Quoted strings that hold timestamps in the form produced by
// to_value_string() are read as datetimes.
dynamic
parse_yaml_value(char const* yaml, size_t length);

// Same as above, but accepts a string.
inline dynamic
parse_yaml_value(string const& yaml)
{
    return parse_yaml_value(yaml.c_str(), yaml.length());
}

// Write a value to a string in YAML format.
// If :v is cyclic, this throws cyclic_value.
string
value_to_yaml(dynamic const& v);

// Write a value to a diagnostic string in YAML format.
// This won't necessarily capture the entire contents of the value. In
// particular, it will omit the contents of large arrays and maps, and it
// marks the point where a cyclic value refers back to itself.
string
value_to_diagnostic_yaml(dynamic const& v);

} // namespace treediff

#endif

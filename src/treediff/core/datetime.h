#ifndef TREEDIFF_CORE_DATETIME_H
#define TREEDIFF_CORE_DATETIME_H

#include <treediff/core/type_definitions.h>

namespace treediff {

// Get the preferred user-readable string representation of a ptime.
string
to_string(ptime const& t);

// Get the preferred representation for encoding a ptime as a string.
// This is ISO 8601 in UTC with milliseconds, e.g., 2020-06-15T12:30:00.000Z.
string
to_value_string(ptime const& t);

// Parse a string in the form produced by to_value_string().
// If :s isn't in that form, this throws parsing_error.
ptime
parse_ptime(string const& s);

// Convert between ptimes and milliseconds since the Unix epoch.
// Sub-millisecond precision is discarded.
integer
to_milliseconds_since_epoch(ptime const& t);
ptime
ptime_from_milliseconds_since_epoch(integer ms);

} // namespace treediff

#endif

#ifndef TREEDIFF_DIFF_ENCODING_H
#define TREEDIFF_DIFF_ENCODING_H

#include <treediff/diff/types.h>

// Conversion of records to and from their serialized form.
//
// A record is serialized as a map:
//
//   kind: E, N, D or A
//   path: array of strings and indices (omitted at the root)
//   lhs, rhs: the values (as appropriate for the kind)
//   index: the array index (only for A)
//   item: {kind: N, rhs: ...} or {kind: D, lhs: ...} (only for A)
//   $dates: array of date marker paths (omitted if there are none)

namespace treediff {

dynamic
to_dynamic(value_diff_item const& item);

// Indices (in paths and array changes) must be integers between 0 and
// max_serialized_index, the largest integer a JSON number holds exactly.
static double const max_serialized_index = 9007199254740991.0;

// Read a serialized record.
// If :record is malformed, this throws invalid_change.
value_diff_item
read_value_diff_item(dynamic const& record);

dynamic
value_diff_to_dynamic(value_diff const& diff);

// Read a serialized list of records.
// If :records isn't an array of valid records, this throws invalid_change.
value_diff
read_value_diff(dynamic const& records);

// Write a list of records as JSON. none is written as null.
string
value_diff_to_json(optional<value_diff> const& diff, int indent = 4);

// Parse a JSON list of records. null and an empty list both yield none.
// Note that the records' datetimes come back as strings. They're restored
// when the records are applied.
optional<value_diff>
parse_value_diff_json(string const& json);

} // namespace treediff

#endif

#ifndef TREEDIFF_DIFF_APPLY_H
#define TREEDIFF_DIFF_APPLY_H

#include <treediff/diff/types.h>

namespace treediff {

// All of the following mutate :target in place. Values written into :target
// are copies, so :target never shares containers with the records.
//
// Before a value is written, the datetime leaves named by the record's date
// markers are restored from their string form (if they've been through a
// text encoding).
//
// Missing (or nil) containers along a record's path are created: an array if
// the next path element is an index and a map otherwise. An index applied to
// a map addresses the field named by its decimal form.
//
// Each record is checked before anything is changed, so a record that fails
// leaves :target as it was.
//
// Reaching an index past the end of an array pads it with nils, but by no more
// than max_array_padding elements. Records that would need more throw
// invalid_path.
static size_t const max_array_padding = 0x100000;

// Apply a single record to move :target toward its rhs.
// :target must be an array or map. Otherwise, this throws invalid_target.
// A record without a path replaces :target (or clears it to nil for a
// removal), except for an array_change, which acts on :target itself.
void
apply_change(dynamic& target, value_diff_item const& item);

// Same, but :record is in its serialized form (see diff/encoding.h).
void
apply_change(dynamic& target, dynamic const& record);

// Revert a single record to move :target toward its lhs.
// :target must be an array or map, and :item must have a path.
void
revert_change(dynamic& target, value_diff_item const& item);

void
revert_change(dynamic& target, dynamic const& record);

// Apply a whole list of records, as produced by compute_value_diff().
// The records are applied in order, except that the array deletions are
// applied from the highest index to the lowest (within the positions they
// occupy in the list) so that earlier deletions don't shift later ones.
// If :diff is none or empty, or :target is nil, this does nothing.
// If a record fails, the ones before it have already been applied.
void
apply_value_diff(dynamic& target, optional<value_diff> const& diff);

// Same, but :records is a serialized list (or nil).
void
apply_value_diff(dynamic& target, dynamic const& records);

// Revert a whole list of records, in the reverse of the order that
// apply_value_diff() applies them.
void
revert_value_diff(dynamic& target, optional<value_diff> const& diff);

} // namespace treediff

#endif

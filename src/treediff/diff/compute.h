#ifndef TREEDIFF_DIFF_COMPUTE_H
#define TREEDIFF_DIFF_COMPUTE_H

#include <treediff/diff/types.h>

namespace treediff {

// Compute the differences between two values.
// Applying the result to :lhs will yield a value equal to :rhs.
// If the two are equal, this returns none. Otherwise, the result is a
// non-empty list of records in the order they were encountered while walking
// the two values.
//
// An absent :lhs (or :rhs) is treated like a missing map field, so the result
// is a single addition (or removal) at the root.
//
// Either value may be cyclic. A container that's reached again while it's
// still being compared is treated as equal at that point.
//
// Note that the records share containers with :lhs and :rhs.
optional<value_diff>
compute_value_diff(optional<dynamic> const& lhs, optional<dynamic> const& rhs);

optional<value_diff>
compute_value_diff(dynamic const& lhs, dynamic const& rhs);

} // namespace treediff

#endif

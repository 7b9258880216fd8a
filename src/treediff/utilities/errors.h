#ifndef TREEDIFF_UTILITIES_ERRORS_H
#define TREEDIFF_UTILITIES_ERRORS_H

#include <treediff/core/exception.h>

namespace treediff {

// If an error occurs internally within library that provides its own
// error messages, this is used to convey that message.
TREEDIFF_DEFINE_ERROR_INFO(string, internal_error_message)

} // namespace treediff

#endif

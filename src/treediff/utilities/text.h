#ifndef TREEDIFF_UTILITIES_TEXT_H
#define TREEDIFF_UTILITIES_TEXT_H

#include <boost/lexical_cast.hpp>

#include <treediff/core/exception.h>

namespace treediff {

using boost::lexical_cast;

// If a simple parsing operation fails, this exception can be thrown.
TREEDIFF_DEFINE_EXCEPTION(parsing_error)
TREEDIFF_DEFINE_ERROR_INFO(string, expected_format)
TREEDIFF_DEFINE_ERROR_INFO(string, parsed_text)
TREEDIFF_DEFINE_ERROR_INFO(string, parsing_error)

// invalid_enum_value is thrown when an enum's raw (integer) value is invalid.
TREEDIFF_DEFINE_EXCEPTION(invalid_enum_value)
TREEDIFF_DEFINE_ERROR_INFO(string, enum_id)
TREEDIFF_DEFINE_ERROR_INFO(int, enum_value)

// invalid_enum_string is thrown when attempting to convert a string value to
// an enum and the string doesn't match any of the enum's cases.
TREEDIFF_DEFINE_EXCEPTION(invalid_enum_string)
// Note that this also uses the enum_id info declared above.
TREEDIFF_DEFINE_ERROR_INFO(string, enum_string)

} // namespace treediff

#endif

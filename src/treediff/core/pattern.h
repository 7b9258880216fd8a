#ifndef TREEDIFF_CORE_PATTERN_H
#define TREEDIFF_CORE_PATTERN_H

#include <memory>
#include <string>

#include <boost/regex.hpp>

namespace treediff {

// A pattern is a compiled regular expression that remembers the source text
// and flags it was compiled from, so that it can be compared and serialized by
// its canonical string form, /source/flags.
struct pattern
{
    std::string source;
    // sorted, without duplicates
    std::string flags;
    std::shared_ptr<boost::regex const> matcher;
};

// Compile a pattern.
// 'i' makes it case-insensitive, 'm' lets ^ and $ match at line breaks and
// 's' lets . match newlines. Other flag characters are kept in the canonical
// form but don't affect matching.
// If :source isn't a valid expression, this throws parsing_error.
pattern
make_pattern(std::string source, std::string flags = "");

// Get the canonical string form of a pattern.
std::string
to_string(pattern const& p);

// Search for :p anywhere within :s.
bool
matches(pattern const& p, std::string const& s);

bool
operator==(pattern const& a, pattern const& b);
bool
operator!=(pattern const& a, pattern const& b);

std::ostream&
operator<<(std::ostream& os, pattern const& p);

} // namespace treediff

#endif

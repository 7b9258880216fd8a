#ifndef TREEDIFF_UTILITIES_TESTING_H
#define TREEDIFF_UTILITIES_TESTING_H

#define CATCH_CONFIG_CPP11_NO_NULLPTR
#include <catch.hpp>

#include <algorithm>
#include <cctype>

#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/optional/optional_io.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <treediff/core/dynamic.h>

namespace treediff {

// Make a ptime for tests.
inline ptime
make_test_time(
    int year,
    int month,
    int day,
    int hours = 0,
    int minutes = 0,
    int seconds = 0,
    int milliseconds = 0)
{
    return ptime(
        boost::gregorian::date(year, month, day),
        boost::posix_time::time_duration(hours, minutes, seconds)
            + boost::posix_time::milliseconds(milliseconds));
}

// Strip all whitespace from :s.
inline string
strip_whitespace(string s)
{
    s.erase(
        std::remove_if(
            s.begin(),
            s.end(),
            [](char c) { return std::isspace(static_cast<unsigned char>(c)); }),
        s.end());
    return s;
}

} // namespace treediff

#endif

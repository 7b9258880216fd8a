#include <treediff/core/datetime.h>

#include <iostream>
#include <locale>
#include <sstream>

#include <fmt/format.h>

#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <treediff/utilities/text.h>

namespace treediff {

static ptime const the_epoch(boost::gregorian::date(1970, 1, 1));

string
to_string(ptime const& t)
{
    namespace bt = boost::posix_time;
    std::ostringstream os;
    os.imbue(
        std::locale(std::cout.getloc(), new bt::time_facet("%Y-%m-%d %X")));
    os << t;
    return os.str();
}

string
to_value_string(ptime const& t)
{
    namespace bt = boost::posix_time;
    std::ostringstream os;
    os.imbue(
        std::locale(std::cout.getloc(), new bt::time_facet("%Y-%m-%dT%H:%M")));
    os << t;
    // Add the seconds and timezone manually so that the milliseconds always
    // appear.
    os << fmt::format(
        ":{:02d}.{:03d}Z",
        t.time_of_day().seconds(),
        t.time_of_day().total_milliseconds() % 1000);
    return os.str();
}

ptime
parse_ptime(string const& s)
{
    namespace bt = boost::posix_time;
    std::istringstream is(s);
    is.imbue(std::locale(
        std::cout.getloc(), new bt::time_input_facet("%Y-%m-%dT%H:%M:%s")));
    ptime t;
    char z = '\0';
    try
    {
        is >> t;
        is.get(z);
    }
    catch (std::exception& e)
    {
        // Out-of-range fields (e.g., a 13th month) are reported this way.
        TREEDIFF_THROW(
            parsing_error() << expected_format_info("datetime")
                            << parsed_text_info(s)
                            << parsing_error_info(e.what()));
    }
    if (!t.is_special() && z == 'Z'
        && is.peek() == std::istringstream::traits_type::eof())
    {
        return t;
    }
    TREEDIFF_THROW(
        parsing_error() << expected_format_info("datetime")
                        << parsed_text_info(s));
}

integer
to_milliseconds_since_epoch(ptime const& t)
{
    return (t - the_epoch).total_milliseconds();
}

ptime
ptime_from_milliseconds_since_epoch(integer ms)
{
    return the_epoch + boost::posix_time::milliseconds(ms);
}

} // namespace treediff

#include <treediff/core/pattern.h>

#include <algorithm>
#include <ostream>

#include <treediff/utilities/text.h>

namespace treediff {

pattern
make_pattern(std::string source, std::string flags)
{
    std::sort(flags.begin(), flags.end());
    flags.erase(std::unique(flags.begin(), flags.end()), flags.end());

    auto has_flag = [&](char f) { return flags.find(f) != std::string::npos; };
    boost::regex::flag_type syntax = boost::regex::perl;
    if (has_flag('i'))
        syntax |= boost::regex::icase;
    if (!has_flag('m'))
        syntax |= boost::regex::no_mod_m;
    syntax |= has_flag('s') ? boost::regex::mod_s : boost::regex::no_mod_s;

    pattern p;
    try
    {
        p.matcher = std::make_shared<boost::regex const>(source, syntax);
    }
    catch (boost::regex_error& e)
    {
        TREEDIFF_THROW(
            parsing_error() << expected_format_info("regular expression")
                            << parsed_text_info(source)
                            << parsing_error_info(e.what()));
    }
    p.source = std::move(source);
    p.flags = std::move(flags);
    return p;
}

std::string
to_string(pattern const& p)
{
    return "/" + p.source + "/" + p.flags;
}

bool
matches(pattern const& p, std::string const& s)
{
    return p.matcher && boost::regex_search(s, *p.matcher);
}

bool
operator==(pattern const& a, pattern const& b)
{
    return a.source == b.source && a.flags == b.flags;
}
bool
operator!=(pattern const& a, pattern const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& os, pattern const& p)
{
    os << to_string(p);
    return os;
}

} // namespace treediff

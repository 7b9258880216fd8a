#include <treediff/config.h>

#include <cmath>

#include <treediff/utilities/text.h>

namespace treediff {

tool_config
read_tool_config(dynamic const& v)
{
    auto const& map = cast<dynamic_map>(v);
    tool_config config;
    read_optional_field(&config.log_level, map, "log_level");
    read_optional_field(&config.log_file, map, "log_file");
    optional<double> indent;
    read_optional_field(&indent, map, "indent");
    if (indent)
    {
        if (*indent != std::floor(*indent) || std::fabs(*indent) > 64)
        {
            TREEDIFF_THROW(
                parsing_error()
                << expected_format_info("indentation level")
                << parsed_text_info(lexical_cast<string>(*indent)));
        }
        config.indent = static_cast<integer>(*indent);
    }
    return config;
}

logging_config
get_logging_config(tool_config const& config)
{
    logging_config logging;
    logging.level = config.log_level;
    logging.file = config.log_file;
    return logging;
}

int
get_indent(tool_config const& config)
{
    return config.indent ? static_cast<int>(*config.indent) : 4;
}

} // namespace treediff

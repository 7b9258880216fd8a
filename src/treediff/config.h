#ifndef TREEDIFF_CONFIG_H
#define TREEDIFF_CONFIG_H

#include <treediff/core/dynamic.h>
#include <treediff/utilities/logging.h>

namespace treediff {

// configuration of the treediff command-line tool
struct tool_config
{
    // the minimum level to log (trace, debug, info, warn, err, critical, off)
    optional<string> log_level;
    // a file to write the log to (in addition to stderr)
    optional<string> log_file;
    // the number of spaces per nesting level in JSON output - If this is
    // negative, output is written on a single line. (defaults to 4)
    optional<integer> indent;
};

// Read a tool_config from its dynamic form (e.g., a parsed JSON file).
// Omitted fields are left as none. Fields that aren't recognized are ignored.
tool_config
read_tool_config(dynamic const& v);

logging_config
get_logging_config(tool_config const& config);

// Get the JSON indentation that :config calls for.
int
get_indent(tool_config const& config);

} // namespace treediff

#endif

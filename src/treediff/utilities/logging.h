#ifndef TREEDIFF_UTILITIES_LOGGING_H
#define TREEDIFF_UTILITIES_LOGGING_H

#include <memory>
#include <sstream>
#include <type_traits>

#include <spdlog/spdlog.h>

#include <treediff/core/exception.h>

namespace treediff {

struct logging_config
{
    // the minimum level to log, by spdlog name (trace, debug, info, warn, err,
    // critical, off) - If this is omitted, the TREEDIFF_LOG_LEVEL environment
    // variable is consulted, and failing that, it defaults to warn.
    optional<string> level;
    // a file to log to (in addition to stderr)
    optional<string> file;
};

// Create and register the "treediff" logger according to :config.
// If the logger already exists, only its level is updated.
void
initialize_logging(logging_config const& config);

// Get the "treediff" logger.
// If initialize_logging() hasn't been called, this creates a default one.
std::shared_ptr<spdlog::logger>
get_logger();

// Parse a log level name.
// If :name isn't a valid level, this throws invalid_enum_string.
spdlog::level::level_enum
parse_log_level(string const& name);

namespace detail {

template<class Value>
struct arg_logger
{
    arg_logger(char const* name, Value const& value) : name(name), value(value)
    {
    }

    char const* name;
    Value const& value;
};

template<class Value>
std::ostream&
operator<<(std::ostream& stream, arg_logger<Value> arg)
{
    stream << "\n" << arg.name << ": " << arg.value;
    return stream;
}

} // namespace detail

// Log a function call (at debug level).
#define TREEDIFF_LOG_CALL(args)                                               \
    {                                                                         \
        auto logger = treediff::get_logger();                                 \
        if (logger->should_log(spdlog::level::debug))                         \
        {                                                                     \
            std::ostringstream stream;                                        \
            stream << __func__ args;                                          \
            logger->debug(stream.str());                                      \
        }                                                                     \
    }

// Log an argument to a function call.
#define TREEDIFF_LOG_ARG(arg)                                                 \
    treediff::detail::arg_logger<                                             \
        std::remove_reference<std::remove_const<decltype(arg)>::type>::type>( \
        #arg, arg)

} // namespace treediff

#endif

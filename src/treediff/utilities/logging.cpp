#include <treediff/utilities/logging.h>

#include <cstdlib>
#include <mutex>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <treediff/utilities/text.h>

namespace treediff {

static std::mutex the_logger_mutex;

spdlog::level::level_enum
parse_log_level(string const& name)
{
    auto level = spdlog::level::from_str(name);
    // from_str() maps anything it doesn't recognize to off.
    if (level == spdlog::level::off && name != "off")
    {
        TREEDIFF_THROW(
            invalid_enum_string()
            << enum_id_info("log_level") << enum_string_info(name));
    }
    return level;
}

// An explicit level wins over TREEDIFF_LOG_LEVEL, which wins over the default.
static spdlog::level::level_enum
resolve_log_level(logging_config const& config)
{
    if (config.level)
        return parse_log_level(*config.level);
    char const* env_level = std::getenv("TREEDIFF_LOG_LEVEL");
    if (env_level && *env_level != '\0')
        return parse_log_level(env_level);
    return spdlog::level::warn;
}

static std::shared_ptr<spdlog::logger>
create_logger(logging_config const& config, spdlog::level::level_enum level)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (config.file)
    {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            *config.file, 262144, 2));
    }
    auto logger
        = std::make_shared<spdlog::logger>("treediff", begin(sinks), end(sinks));
    logger->set_level(level);
    spdlog::register_logger(logger);
    return logger;
}

void
initialize_logging(logging_config const& config)
{
    std::lock_guard<std::mutex> lock(the_logger_mutex);
    auto level = resolve_log_level(config);
    auto existing = spdlog::get("treediff");
    if (existing)
        existing->set_level(level);
    else
        create_logger(config, level);
}

std::shared_ptr<spdlog::logger>
get_logger()
{
    std::lock_guard<std::mutex> lock(the_logger_mutex);
    auto logger = spdlog::get("treediff");
    if (!logger)
    {
        // Library code calls this implicitly, so a bad TREEDIFF_LOG_LEVEL
        // shouldn't make it fail.
        auto level = spdlog::level::warn;
        optional<string> rejected_level;
        try
        {
            level = resolve_log_level(logging_config());
        }
        catch (invalid_enum_string& e)
        {
            rejected_level = get_required_error_info<enum_string_info>(e);
        }
        logger = create_logger(logging_config(), level);
        if (rejected_level)
        {
            logger->warn(
                "ignoring invalid TREEDIFF_LOG_LEVEL: {}", *rejected_level);
        }
    }
    return logger;
}

} // namespace treediff

#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

std::shared_ptr<spdlog::logger> setup_logging(const std::string &level)
{
    auto logger = spdlog::get(kLoggerName);
    if (!logger)
    {
        logger = spdlog::stdout_color_mt(kLoggerName);
        logger->set_pattern("%Y-%m-%d %H:%M:%S - %n - %^%l%$ - %v");
    }
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && level != "off")
    {
        parsed = spdlog::level::info;
    }
    logger->set_level(parsed);
    return logger;
}

std::shared_ptr<spdlog::logger> get_logger()
{
    auto logger = spdlog::get(kLoggerName);
    if (!logger)
    {
        logger = setup_logging();
    }
    return logger;
}

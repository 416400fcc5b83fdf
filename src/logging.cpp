#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace eph_log
{
void init(spdlog::level::level_enum level)
{
    auto logger = spdlog::get("eph");
    if (!logger)
    {
        logger = spdlog::stdout_color_mt("eph");
        logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    }
    logger->set_level(level);
}

std::shared_ptr<spdlog::logger> get()
{
    auto logger = spdlog::get("eph");
    if (!logger)
    {
        init(spdlog::level::info);
        logger = spdlog::get("eph");
    }
    return logger;
}
} // namespace eph_log

/**
 * @file Logging.cpp
 * @brief Creation of the library logger.
 */

#include "blobio/Logging.hpp"
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace blobio
{
    namespace
    {
        std::shared_ptr<spdlog::logger> createLogger()
        {
            auto existing = spdlog::get(kLoggerName);
            if (existing)
            {
                return existing;
            }

            auto created = spdlog::stderr_color_mt(kLoggerName);
            created->set_level(spdlog::level::warn);

            // SPDLOG_LEVEL, if set, overrides the default above.
            spdlog::cfg::load_env_levels();
            return created;
        }
    } // namespace

    spdlog::logger& logger()
    {
        static std::shared_ptr<spdlog::logger> instance = createLogger();
        return *instance;
    }

    void setLogLevel(spdlog::level::level_enum level)
    {
        logger().set_level(level);
    }

} // namespace blobio

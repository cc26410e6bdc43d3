/**
 * @file Logging.hpp
 * @brief Access to the library's spdlog logger.
 *
 * The library logs through one named logger, "blobio", writing to
 * stderr. Its level defaults to warn and can be overridden with the
 * SPDLOG_LEVEL environment variable (e.g. SPDLOG_LEVEL=blobio=trace)
 * or at runtime with setLogLevel().
 */

#pragma once

#include <spdlog/spdlog.h>

namespace blobio
{
    /// @brief Name of the library logger in the spdlog registry.
    inline constexpr const char* kLoggerName = "blobio";

    /**
     * @brief Returns the library logger, creating it on first use.
     */
    spdlog::logger& logger();

    /**
     * @brief Sets the level of the library logger.
     */
    void setLogLevel(spdlog::level::level_enum level);

} // namespace blobio

#ifndef CKG_LOGGING_HPP
#define CKG_LOGGING_HPP

/**
 * @file logging.hpp
 * @brief Engine-wide logger backed by spdlog.
 *
 * All components log through logging::get(). Until configure() is called
 * the logger writes to stderr at info level.
 */

#include "ckg/core/config.hpp"
#include "ckg/result.hpp"
#include "ckg/error.hpp"

#include <spdlog/spdlog.h>

#include <memory>

namespace ckg::logging {

    inline constexpr const char* LOGGER_NAME = "ckg";

    /**
     * Rebuilds the engine logger from the logging config (console and/or
     * file sink, level and pattern).
     *
     * @return IoError if the log file cannot be opened, ConfigError for an
     *         unknown level.
     */
    Result<void, Error> configure(const LoggingConfig& config);

    /**
     * Returns the engine logger, creating the default one on first use.
     */
    std::shared_ptr<spdlog::logger> get();

}  // namespace ckg::logging

#endif //CKG_LOGGING_HPP

#ifndef CCA_LOGGING_HPP
#define CCA_LOGGING_HPP

/**
 * @file logging.hpp
 * @brief Access to the library's named spdlog logger.
 *
 * All library diagnostics go through one logger named "cca" writing to
 * stderr. Applications that install their own sinks can register a logger
 * under that name before first use and it will be picked up.
 */

#include "cca/config.hpp"
#include "cca/error.hpp"
#include "cca/result.hpp"

#include <spdlog/spdlog.h>

#include <memory>

namespace cca::logging {

    inline constexpr const char* LOGGER_NAME = "cca";

    /**
     * Returns the library logger, creating it on first call.
     */
    [[nodiscard]] std::shared_ptr<spdlog::logger> get_logger();

    /**
     * Applies level and pattern to the library logger.
     *
     * @return ConfigError if the level name is not recognised
     */
    Result<void, Error> configure(const LoggingConfig& config);

}  // namespace cca::logging

#endif //CCA_LOGGING_HPP

#include "cca/utils/logging.hpp"
#include "cca/utils/string_utils.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace cca::logging
{
    namespace {

        std::shared_ptr<spdlog::logger> create_logger() {
            if (auto existing = spdlog::get(LOGGER_NAME)) {
                return existing;
            }
            auto logger = spdlog::stderr_color_mt(LOGGER_NAME);
            logger->set_level(spdlog::level::info);
            return logger;
        }

    }  // namespace

    std::shared_ptr<spdlog::logger> get_logger() {
        static std::shared_ptr<spdlog::logger> logger = create_logger();
        return logger;
    }

    Result<void, Error> configure(const LoggingConfig& config) {
        const std::string name = string_utils::to_lower(config.level);
        const auto level = spdlog::level::from_str(name);
        if (level == spdlog::level::off && name != "off") {
            return Result<void, Error>::failure(
                Error::config_error("Unknown log level: " + config.level)
            );
        }

        auto logger = get_logger();
        logger->set_level(level);
        if (!config.pattern.empty()) {
            logger->set_pattern(config.pattern);
        }
        return Result<void, Error>::success();
    }

}  // namespace cca::logging

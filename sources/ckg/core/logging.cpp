#include "ckg/core/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <vector>

namespace ckg::logging {

    namespace {

        std::mutex& logger_mutex() {
            static std::mutex mutex;
            return mutex;
        }

        std::shared_ptr<spdlog::logger>& logger_slot() {
            static std::shared_ptr<spdlog::logger> logger;
            return logger;
        }

        std::shared_ptr<spdlog::logger> make_default_logger() {
            auto logger = std::make_shared<spdlog::logger>(
                LOGGER_NAME,
                std::make_shared<spdlog::sinks::stderr_color_sink_mt>()
            );
            logger->set_level(spdlog::level::info);
            logger->set_pattern(LoggingConfig{}.pattern);
            return logger;
        }

    }  // namespace

    Result<void, Error> configure(const LoggingConfig& config) {
        const auto level = spdlog::level::from_str(config.level);
        if (level == spdlog::level::off && config.level != "off") {
            return Result<void, Error>::failure(
                Error::config_error("Unknown log level", config.level)
            );
        }

        std::vector<spdlog::sink_ptr> sinks;
        if (config.console) {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }
        if (!config.file.empty()) {
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file, false));
            } catch (const spdlog::spdlog_ex& e) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to open log file: " + std::string(e.what()), config.file)
                );
            }
        }

        auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->set_pattern(config.pattern);

        std::lock_guard lock(logger_mutex());
        logger_slot() = std::move(logger);
        return Result<void, Error>::success();
    }

    std::shared_ptr<spdlog::logger> get() {
        std::lock_guard lock(logger_mutex());
        auto& logger = logger_slot();
        if (!logger) {
            logger = make_default_logger();
        }
        return logger;
    }

}  // namespace ckg::logging

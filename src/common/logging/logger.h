/**
 * @file logger.h
 * @brief Logging setup on top of spdlog
 *
 * Installs the process-wide default spdlog logger; components log through
 * spdlog::info/debug/... directly. Console output goes to stderr so the
 * CLI can keep stdout for the verification result.
 */

#pragma once

#include "shared/exception/InfrastructureException.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>
#include <vector>

namespace epassport::common {

class Logger {
private:
    // from_str maps unknown names to off; "off" itself is honoured
    static spdlog::level::level_enum parseLevel(const std::string& level) {
        auto parsed = spdlog::level::from_str(level);
        if (parsed == spdlog::level::off && level != "off") {
            return spdlog::level::info;
        }
        return parsed;
    }

public:
    static constexpr size_t kMaxFileBytes = 10 * 1024 * 1024;
    static constexpr size_t kMaxFiles = 3;

    /**
     * @param name logger name shown in every line
     * @param level spdlog level name; unknown names fall back to info
     * @param logFile rotating file sink path, empty for console only
     * @throws InfrastructureException LOGGER_INIT_FAILED if the file sink
     *         cannot be opened
     */
    static void initialize(const std::string& name, const std::string& level, const std::string& logFile = "") {
        std::vector<spdlog::sink_ptr> sinks;
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("%H:%M:%S.%e %^%-5l%$ %v");
        sinks.push_back(console);

        if (!logFile.empty()) {
            try {
                auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logFile, kMaxFileBytes, kMaxFiles);
                file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [t%t] %v");
                sinks.push_back(file);
            } catch (const spdlog::spdlog_ex& ex) {
                throw shared::exception::InfrastructureException(
                    "LOGGER_INIT_FAILED", "Cannot open log file " + logFile + ": " + ex.what());
            }
        }

        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(parseLevel(level));
        spdlog::set_default_logger(logger);
        spdlog::flush_on(spdlog::level::warn);

        spdlog::debug("Logging at {} to console{}", level, logFile.empty() ? "" : " and " + logFile);
    }

    static void setLevel(const std::string& level) {
        spdlog::set_level(parseLevel(level));
    }

    static void flush() {
        spdlog::default_logger()->flush();
    }
};

} // namespace epassport::common

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#define UUIDCODEC_LOGGER_NAME "uuidcodec"

/*
 * UUIDLog - Library logger
 *
 * One named spdlog logger shared by the library and the examples.
 * Output goes to stderr so generated UUIDs on stdout stay clean.
 */
class UUIDLog {
public:
    /**
     * @brief Get the library logger, creating it on first use.
     * Reuses a logger the application already registered under the same name.
     */
    static std::shared_ptr<spdlog::logger>& logger() {
        static std::shared_ptr<spdlog::logger> s_logger = create();
        return s_logger;
    }

    /**
     * @brief Set the minimum level that gets printed.
     */
    static void setLevel(spdlog::level::level_enum level) {
        logger()->set_level(level);
    }

    /**
     * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "critical", "off").
     * @return true if the name is known.
     */
    static bool levelFromName(const std::string& name, spdlog::level::level_enum* out) {
        if (!out) return false;
        spdlog::level::level_enum lvl = spdlog::level::from_str(name);
        // from_str() maps unknown names to "off"
        if (lvl == spdlog::level::off && name != "off") return false;
        *out = lvl;
        return true;
    }

private:
    static std::shared_ptr<spdlog::logger> create() {
        std::shared_ptr<spdlog::logger> existing = spdlog::get(UUIDCODEC_LOGGER_NAME);
        if (existing) return existing;

        std::shared_ptr<spdlog::logger> log = spdlog::stderr_color_mt(UUIDCODEC_LOGGER_NAME);
        log->set_pattern("[uuidcodec] [%H:%M:%S.%e] [%^%l%$] %v");
        log->set_level(spdlog::level::info);
        return log;
    }
};

#pragma once

#include <stddef.h>
#include <string>

#include <spdlog/spdlog.h>

#include "UUIDFormat.h"

#define UUIDCODEC_MAX_BATCH 10000

/*
 * Settings for bulk generation, read from YAML:
 *
 *   version: 7          # 1, 4 or 7
 *   quantity: 5         # 1..10000
 *   uppercase: false
 *   dashes: true
 *   output: uuids.txt   # "" writes to stdout
 *   log_level: info
 *
 * Missing keys keep their defaults. Bad values are logged and ignored.
 */
struct UUIDConfig {
    UUIDVersion version;
    size_t quantity;
    bool uppercase;
    bool dashes;
    std::string output;
    spdlog::level::level_enum logLevel;

    UUIDConfig()
        : version(UUID_VERSION_4), quantity(5), uppercase(false), dashes(true),
          logLevel(spdlog::level::info) {}

    /**
     * @brief Load settings from a YAML file.
     * A missing or malformed file yields the defaults (logged as a warning).
     */
    static UUIDConfig loadFile(const std::string& path);

    /**
     * @brief Load settings from YAML text.
     */
    static UUIDConfig loadString(const std::string& text);
};

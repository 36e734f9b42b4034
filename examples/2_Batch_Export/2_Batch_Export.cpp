/*
 * EXAMPLE 2: Batch Export
 *
 * Generates a batch of UUIDs as described by a YAML file and writes them
 * one per line, the way a "download all" button would.
 *
 * Usage: 2_Batch_Export [config.yaml]
 *
 *   version: 7
 *   quantity: 20
 *   uppercase: false
 *   dashes: true
 *   output: uuids.txt
 *   log_level: info
 *
 * The history keeps the newest batch first, like a generated-list panel.
 */

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "UUIDCodec.h"

int main(int argc, char* argv[]) {
    std::string config_path = "config/uuidcodec.yaml";
    if (argc > 1) {
        config_path = argv[1];
    }

    UUIDConfig config = UUIDConfig::loadFile(config_path);
    UUIDLog::setLevel(config.logLevel);

    UUIDLog::logger()->info("Batch config:");
    UUIDLog::logger()->info("  version: {}", (int)config.version);
    UUIDLog::logger()->info("  quantity: {}", config.quantity);
    UUIDLog::logger()->info("  uppercase: {}", config.uppercase ? "yes" : "no");
    UUIDLog::logger()->info("  dashes: {}", config.dashes ? "yes" : "no");
    UUIDLog::logger()->info("  output: {}", config.output.empty() ? "<stdout>" : config.output);

    EasyUUID uuid;
    std::vector<std::string> batch;
    if (!uuid.generateBatch(config.version, config.quantity, &batch)) {
        UUIDLog::logger()->error("Batch stopped after {} of {} UUIDs", batch.size(), config.quantity);
        return 1;
    }

    for (size_t i = 0; i < batch.size(); i++) {
        if (config.uppercase || !config.dashes) {
            uint8_t raw[16];
            char buf[37];
            if (UUIDGen::parseFromString(batch[i].c_str(), raw) &&
                UUIDFormat::toString(raw, buf, sizeof(buf), config.uppercase, config.dashes)) {
                batch[i] = buf;
            }
        }
    }

    // Newest first
    std::vector<std::string> history(batch.rbegin(), batch.rend());

    std::string blob = EasyUUID::joinLines(history);
    if (config.output.empty()) {
        std::cout << blob << "\n";
    } else {
        std::ofstream file(config.output.c_str());
        if (!file) {
            UUIDLog::logger()->error("Cannot open {} for writing", config.output);
            return 1;
        }
        file << blob << "\n";
        UUIDLog::logger()->info("Wrote {} UUIDs to {}", history.size(), config.output);
    }

    return 0;
}

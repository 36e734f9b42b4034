#include "UUIDConfig.h"
#include "UUIDGen.h"
#include "UUIDLog.h"

#include <yaml-cpp/yaml.h>

namespace {

void apply(const YAML::Node& yaml, UUIDConfig* config) {
    if (!yaml.IsMap()) {
        if (!yaml.IsNull()) {
            UUIDLog::logger()->warn("config root is not a mapping. Using defaults.");
        }
        return;
    }

    if (yaml["version"]) {
        int v = yaml["version"].as<int>(0);
        UUIDVersion parsed;
        if (UUIDGen::versionFromInt(v, &parsed)) {
            config->version = parsed;
        } else {
            UUIDLog::logger()->warn("unsupported version '{}' in config, keeping v{}",
                                    yaml["version"].as<std::string>(""), (int)config->version);
        }
    }

    if (yaml["quantity"]) {
        long long q = yaml["quantity"].as<long long>(0);
        if (q >= 1 && q <= UUIDCODEC_MAX_BATCH) {
            config->quantity = (size_t)q;
        } else {
            UUIDLog::logger()->warn("quantity must be 1..{}, keeping {}", UUIDCODEC_MAX_BATCH, config->quantity);
        }
    }

    config->uppercase = yaml["uppercase"].as<bool>(config->uppercase);
    config->dashes = yaml["dashes"].as<bool>(config->dashes);
    config->output = yaml["output"].as<std::string>(config->output);

    if (yaml["log_level"]) {
        std::string name = yaml["log_level"].as<std::string>("");
        spdlog::level::level_enum lvl;
        if (UUIDLog::levelFromName(name, &lvl)) {
            config->logLevel = lvl;
        } else {
            UUIDLog::logger()->warn("unknown log_level '{}' in config", name);
        }
    }
}

}  // namespace

UUIDConfig UUIDConfig::loadFile(const std::string& path) {
    UUIDConfig config;
    try {
        apply(YAML::LoadFile(path), &config);
        UUIDLog::logger()->info("Loaded configuration from {}", path);
    } catch (const YAML::Exception& e) {
        UUIDLog::logger()->warn("Failed to load config from {}: {}. Using defaults.", path, e.what());
        config = UUIDConfig();
    }
    return config;
}

UUIDConfig UUIDConfig::loadString(const std::string& text) {
    UUIDConfig config;
    try {
        apply(YAML::Load(text), &config);
    } catch (const YAML::Exception& e) {
        UUIDLog::logger()->warn("Failed to parse config: {}. Using defaults.", e.what());
        config = UUIDConfig();
    }
    return config;
}

#pragma once

#include <string>
#include <vector>
#include <cstring>

#include "UUIDGen.h"

/*
 * EasyUUID - High-Level Wrapper for UUIDGen
 *
 * FEATURES:
 * - std::string conversion.
 * - Internal buffer caching (toCharArray() returns stable pointer).
 * - Per-call version selection and batch generation.
 *
 * COST:
 * - 37 bytes per instance for the cached string.
 * - generate() does not retry: entropy or clock failures reach the caller.
 */
class EasyUUID final : public UUIDGen {
private:
    char _cacheBuffer[37]; // Last generated value, dashed lowercase

public:
    EasyUUID(fill_random_fn rng = nullptr, void* rng_ctx = nullptr, now_ticks_fn now = nullptr, void* now_ctx = nullptr)
        : UUIDGen(rng, rng_ctx, now, now_ctx) {
        memset(_cacheBuffer, 0, sizeof(_cacheBuffer));
    }

    /**
     * @brief Generates a new UUID with the configured version and refreshes the cache.
     * @return false if the entropy or time source failed (cache unchanged).
     */
    bool generate() {
        if (!UUIDGen::generate()) return false;
        UUIDGen::toString(_cacheBuffer, sizeof(_cacheBuffer));
        return true;
    }

    /**
     * @brief Switch to version v and generate.
     */
    bool generate(UUIDVersion v) {
        setVersion(v);
        return generate();
    }

    /**
     * @brief Generate count independent UUIDs of version v, appended to out in generation order.
     * Stops at the first failure; values generated before it stay in out.
     * @return true if all count values were generated.
     */
    bool generateBatch(UUIDVersion v, size_t count, std::vector<std::string>* out) {
        if (!out) return false;
        out->reserve(out->size() + count);
        for (size_t i = 0; i < count; i++) {
            if (!generate(v)) return false;
            out->push_back(std::string(_cacheBuffer));
        }
        return true;
    }

    /**
     * @brief Import 16 raw bytes and update cache.
     * @param bytes Source 16-byte array.
     */
    void fromBytes(const uint8_t bytes[16]) noexcept {
        UUIDGen::fromBytes(bytes);
        UUIDGen::toString(_cacheBuffer, sizeof(_cacheBuffer));
    }

    /**
     * @brief Returns pointer to internal char buffer.
     * Empty string until the first successful generate() or fromBytes().
     */
    const char* toCharArray() const {
        return _cacheBuffer;
    }

    /**
     * @brief Returns the current value as std::string.
     * @param uppercase If true, uses UPPERCASE hex.
     * @param dashes If false, omits hyphens.
     */
    std::string toString(bool uppercase = false, bool dashes = true) const {
        char buf[37];
        UUIDGen::toString(buf, sizeof(buf), uppercase, dashes);
        return std::string(buf);
    }

    /**
     * @brief Join UUIDs one per line for bulk output (no trailing newline).
     */
    static std::string joinLines(const std::vector<std::string>& uuids) {
        std::string out;
        for (size_t i = 0; i < uuids.size(); i++) {
            if (i > 0) out += '\n';
            out += uuids[i];
        }
        return out;
    }

    // Allows: std::string s = uuid;
    operator std::string() const {
        return toString();
    }
};

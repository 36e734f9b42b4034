#pragma once

#define UUIDCODEC_LIB_VERSION "2.0.0"

#include <stdint.h>
#include <stddef.h>
#include <string.h>
#include <ostream>

#include "UUIDFormat.h"

// 100 ns ticks between 1582-10-15T00:00:00Z and 1970-01-01T00:00:00Z
#define UUIDCODEC_GREGORIAN_OFFSET 122192928000000000ULL

class UUIDGen {
public:
    /** Fill dest with len random bytes. Return false if the source is unavailable. */
    typedef bool (*fill_random_fn)(uint8_t* dest, size_t len, void* ctx);
    /** Wall-clock time in 100 ns ticks since the Unix epoch. 0 means unavailable. */
    typedef uint64_t (*now_ticks_fn)(void* ctx);

    /**
     * @brief Initialize generator with optional custom RNG and Time sources.
     * @param rng Pointer to random fill function (nullptr for default).
     * @param rng_ctx User context for RNG.
     * @param now Pointer to tick (100 ns) time function (nullptr for default).
     * @param now_ctx User context for time.
     */
    UUIDGen(fill_random_fn rng = nullptr, void* rng_ctx = nullptr, now_ticks_fn now = nullptr, void* now_ctx = nullptr) noexcept;

    /**
     * @brief Set the UUID version to generate (v1, v4 or v7).
     * @param v UUID version.
     */
    void setVersion(UUIDVersion v) { _version = v; }

    /**
     * @brief Get current configured UUID version.
     * @return Current version.
     */
    UUIDVersion getVersion() const { return _version; }

    /**
     * @brief Map an external integer to a version.
     * Only 1, 4 and 7 are accepted; every other value is rejected.
     * @param v Integer version (e.g. from a command line or config file).
     * @param out Receives the version on success.
     * @return true if v is a supported version.
     */
    static bool versionFromInt(int v, UUIDVersion* out) noexcept;

    /**
     * @brief Generate a new UUID based on current version setting.
     *
     * Thread Safety: the v1 clock sequence state is updated under a
     * process-wide lock. The 16-byte value itself belongs to this instance.
     *
     * @return true if successful, false if the RNG or time source failed
     *         or the configured version is not supported.
     *         The previous value is kept on failure.
     */
    bool generate();

    /**
     * @brief Import 16 raw bytes into the UUID object.
     * @param bytes Source 16-byte array.
     */
    void fromBytes(const uint8_t bytes[16]) noexcept {
        memcpy(_b, bytes, 16);
    }

    /**
     * @brief Format UUID as standard string.
     * @param out Destination buffer (must be >= 37 bytes for dashed, >= 33 for raw).
     * @param buflen Length of destination buffer.
     * @param uppercase If true, uses UPPERCASE hex.
     * @param dashes If false, omits hyphens (32-char result).
     * @return true if successful, false if buffer is too small.
     */
    bool toString(char* out, size_t buflen, bool uppercase = false, bool dashes = true) const noexcept {
        return UUIDFormat::toString(_b, out, buflen, uppercase, dashes);
    }

    /**
     * @brief Access raw 16 bytes of the current UUID.
     * @return Pointer to internal byte array.
     */
    const uint8_t* data() const noexcept { return _b; }

    /**
     * @brief Parse a 36-character (or 32-character raw) UUID string into 16 bytes.
     * @param str Source string.
     * @param out Destination 16-byte array.
     * @return true if string is valid and parsed, false otherwise.
     */
    static bool parseFromString(const char* str, uint8_t out[16]) noexcept {
        return UUIDFormat::parse(str, out);
    }

    /**
     * @brief Clock sequence used by the next v1 UUID (14 bits).
     * Only meaningful after the first v1 generation.
     */
    uint16_t clockSequence() const noexcept { return _clockSeq; }

    // --- Default Platform Implementations ---
    static bool default_fill_random(uint8_t* dest, size_t len, void* ctx) noexcept;
    static uint64_t default_now_ticks(void* ctx) noexcept;

    // --- Comparison and Logic Operators ---

    /** @brief Check if two UUIDs are identical. */
    bool operator==(const UUIDGen& other) const { return memcmp(_b, other._b, 16) == 0; }

    /** @brief Check if two UUIDs are different. */
    bool operator!=(const UUIDGen& other) const { return !(*this == other); }

    /** @brief Lexicographical comparison for sorting. */
    bool operator< (const UUIDGen& other) const { return memcmp(_b, other._b, 16) < 0; }

    friend std::ostream& operator<<(std::ostream& os, const UUIDGen& uuid) {
        char buf[37];
        uuid.toString(buf, sizeof(buf));
        os << buf;
        return os;
    }

private:
    uint8_t _b[16];
    UUIDVersion _version;
    fill_random_fn _rng;
    void* _rng_ctx;
    now_ticks_fn _now;
    void* _now_ctx;

    // v1 state
    bool _v1Seeded;
    uint16_t _clockSeq;
    uint8_t _node[6];
    uint64_t _lastTicks;

    bool _fillChecked(uint8_t* dest, size_t len);
    bool _generateV1();
    bool _generateV4();
    bool _generateV7();
};

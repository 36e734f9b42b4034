#pragma once

#include <stdint.h>
#include <string>

/*
 * UUIDTimestamp - Reconstructs the instant stored in v1 and v7 UUIDs.
 *
 * v1 stores 100 ns ticks since 1582-10-15 (Gregorian reform) in three
 * groups; v7 stores Unix milliseconds in its first 48 bits. Both are
 * rendered as ISO-8601 UTC with millisecond precision.
 */
class UUIDTimestamp {
public:
    static const char* const INVALID; // "Invalid timestamp"
    static const char* const UNKNOWN; // "Unknown format"

    /**
     * @brief Render the timestamp field of a decoded UUID.
     * @param raw UUIDAnalysis::timestampRaw ("tlow-tmid-thi" for v1, 12 hex digits for v7).
     * @param version UUID version the field came from.
     * @return ISO-8601 instant, UNKNOWN for versions other than 1/7,
     *         INVALID if raw cannot be parsed or is out of range.
     */
    static std::string format(const std::string& raw, int version);

    /**
     * @brief Convert a v1 "tlow-tmid-thi" field to Unix milliseconds.
     * The version nibble in thi is masked off. Rounds toward negative infinity.
     * @return false if raw is not three hex groups of at most 8, 4 and 4 digits.
     */
    static bool v1ToUnixMs(const std::string& raw, int64_t* outMs) noexcept;

    /**
     * @brief Convert a v7 field (at most 12 hex digits) to Unix milliseconds.
     */
    static bool v7ToUnixMs(const std::string& raw, int64_t* outMs) noexcept;

    /**
     * @brief Format Unix milliseconds as YYYY-MM-DDTHH:MM:SS.mmmZ.
     * Years outside 0..9999 use the expanded +YYYYYY / -YYYYYY form.
     * @return false if unixMs is beyond +/-8.64e15 (the ECMAScript Date range).
     */
    static bool toISO8601(int64_t unixMs, std::string* out);
};

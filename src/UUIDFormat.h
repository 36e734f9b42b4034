#pragma once

#include <stdint.h>
#include <stddef.h>
#include <string>

/** Versions the generator can produce. */
enum UUIDVersion {
    UUID_VERSION_1 = 1,
    UUID_VERSION_4 = 4,
    UUID_VERSION_7 = 7
};

/** Layout family encoded in the top bits of byte 8. */
enum UUIDVariant {
    UUID_VARIANT_NONE,      // Input was not a UUID
    UUID_VARIANT_NCS,       // 0xxx
    UUID_VARIANT_RFC4122,   // 10xx
    UUID_VARIANT_MICROSOFT, // 110x
    UUID_VARIANT_FUTURE     // 111x
};

/*
 * UUIDFormat - Text layer shared by the generator and the decoder.
 *
 * Canonical form: 8-4-4-4-12 lowercase hex digits.
 * Hyphens sit at text positions 8, 13, 18 and 23.
 */
class UUIDFormat {
public:
    /**
     * @brief Value of a single hex digit.
     * @return 0..15, or -1 if c is not a hex digit.
     */
    static int hexValue(char c) noexcept {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return 10 + c - 'a';
        if (c >= 'A' && c <= 'F') return 10 + c - 'A';
        return -1;
    }

    static bool isHexDigit(char c) noexcept { return hexValue(c) >= 0; }

    /**
     * @brief Remove every '-' from the input.
     */
    static std::string stripHyphens(const std::string& text);

    /**
     * @brief Check that text is exactly 32 hex digits (either case).
     */
    static bool isHex32(const std::string& text) noexcept;

    /**
     * @brief Check that text is in canonical lowercase hyphenated form.
     */
    static bool isCanonical(const std::string& text) noexcept;

    /**
     * @brief Re-insert hyphens into a 32-digit hex string.
     * @return Hyphenated form, or an empty string if hex32 is not 32 hex digits.
     */
    static std::string insertHyphens(const std::string& hex32);

    /**
     * @brief Format 16 bytes as UUID text.
     * @param b Source bytes.
     * @param out Destination buffer (must be >= 37 bytes for dashed, >= 33 for raw).
     * @param buflen Length of destination buffer.
     * @param uppercase If true, uses UPPERCASE hex.
     * @param dashes If false, omits hyphens (32-char result).
     * @return true if successful, false if buffer is too small.
     */
    static bool toString(const uint8_t b[16], char* out, size_t buflen, bool uppercase = false, bool dashes = true) noexcept;

    /**
     * @brief Parse 36-char dashed or 32-char raw UUID text into 16 bytes.
     * @param str Source string.
     * @param out Destination 16-byte array.
     * @return true if string is valid and parsed, false otherwise.
     */
    static bool parse(const char* str, uint8_t out[16]) noexcept;

    /**
     * @brief Classify the variant from the hex digit at text position 16.
     */
    static UUIDVariant variantFromNibble(uint8_t nibble) noexcept;

    /**
     * @brief Display name of a variant ("RFC 4122", "Microsoft", ...).
     */
    static const char* variantName(UUIDVariant variant) noexcept;
};

#pragma once

#include <stdint.h>
#include <string>

#include "UUIDFormat.h"

/*
 * Result of UUIDDecoder::analyze().
 * Absent hex fields are empty strings.
 */
struct UUIDAnalysis {
    bool isValid;
    bool hasVersion;
    uint8_t version;          // Version nibble (0-15), any value is reported
    UUIDVariant variant;      // UUID_VARIANT_NONE when invalid
    std::string timestampRaw; // v1: "tlow-tmid-thi", v7: 12 hex digits
    std::string clockSequence;
    std::string node;
    std::string randomBits;
    std::string hexString;    // Stripped input if valid, original input otherwise

    UUIDAnalysis() : isValid(false), hasVersion(false), version(0), variant(UUID_VARIANT_NONE) {}

    bool hasTimestamp() const { return !timestampRaw.empty(); }
    bool hasClockSequence() const { return !clockSequence.empty(); }
    bool hasNode() const { return !node.empty(); }
    bool hasRandomBits() const { return !randomBits.empty(); }

    const char* variantName() const { return UUIDFormat::variantName(variant); }

    bool operator==(const UUIDAnalysis& other) const {
        return isValid == other.isValid
            && hasVersion == other.hasVersion
            && version == other.version
            && variant == other.variant
            && timestampRaw == other.timestampRaw
            && clockSequence == other.clockSequence
            && node == other.node
            && randomBits == other.randomBits
            && hexString == other.hexString;
    }
    bool operator!=(const UUIDAnalysis& other) const { return !(*this == other); }
};

class UUIDDecoder {
public:
    /**
     * @brief Decode any string into its UUID fields.
     *
     * Hyphens are ignored wherever they appear. The version is not checked
     * against the versions this library generates: unknown versions are
     * reported with no version-specific fields.
     *
     * @param input Text to inspect.
     * @return Analysis record; never fails, see UUIDAnalysis::isValid.
     */
    static UUIDAnalysis analyze(const std::string& input);
};

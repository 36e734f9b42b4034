#include "UUIDDecoder.h"

UUIDAnalysis UUIDDecoder::analyze(const std::string& input) {
    UUIDAnalysis result;
    std::string hex = UUIDFormat::stripHyphens(input);

    if (!UUIDFormat::isHex32(hex)) {
        result.hexString = input;
        return result;
    }

    result.isValid = true;
    result.hexString = hex;
    result.hasVersion = true;
    result.version = (uint8_t)UUIDFormat::hexValue(hex[12]);
    result.variant = UUIDFormat::variantFromNibble((uint8_t)UUIDFormat::hexValue(hex[16]));

    switch (result.version) {
        case 1:
            // time-hi keeps its version nibble, format() masks it
            result.timestampRaw = hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4);
            result.clockSequence = hex.substr(16, 4);
            result.node = hex.substr(20, 12);
            break;
        case 4:
            result.randomBits = hex;
            break;
        case 7:
            result.timestampRaw = hex.substr(0, 12);
            result.randomBits = hex.substr(12, 4) + hex.substr(16, 16);
            break;
        default:
            break;
    }
    return result;
}

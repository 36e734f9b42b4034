#include "UUIDFormat.h"
#include <string.h>

std::string UUIDFormat::stripHyphens(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); i++) {
        if (text[i] != '-') out += text[i];
    }
    return out;
}

bool UUIDFormat::isHex32(const std::string& text) noexcept {
    if (text.size() != 32) return false;
    for (size_t i = 0; i < text.size(); i++) {
        if (!isHexDigit(text[i])) return false;
    }
    return true;
}

bool UUIDFormat::isCanonical(const std::string& text) noexcept {
    if (text.size() != 36) return false;
    for (size_t i = 0; i < text.size(); i++) {
        char c = text[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
        } else if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return true;
}

std::string UUIDFormat::insertHyphens(const std::string& hex32) {
    if (!isHex32(hex32)) return std::string();

    std::string out;
    out.reserve(36);
    out.append(hex32, 0, 8);
    out += '-';
    out.append(hex32, 8, 4);
    out += '-';
    out.append(hex32, 12, 4);
    out += '-';
    out.append(hex32, 16, 4);
    out += '-';
    out.append(hex32, 20, 12);
    return out;
}

bool UUIDFormat::toString(const uint8_t b[16], char* out, size_t buflen, bool uppercase, bool dashes) noexcept {
    size_t required = dashes ? 37 : 33;
    if (!b || !out || buflen < required) return false;

    static const char hexLower[] = "0123456789abcdef";
    static const char hexUpper[] = "0123456789ABCDEF";
    const char* hex = uppercase ? hexUpper : hexLower;
    const uint8_t* p = b;
    char* s = out;

    for (int i = 0; i < 16; i++) {
        if (dashes && (i == 4 || i == 6 || i == 8 || i == 10)) {
            *s++ = '-';
        }
        *s++ = hex[(*p >> 4) & 0x0F];
        *s++ = hex[*p++ & 0x0F];
    }

    *s = '\0';
    return true;
}

bool UUIDFormat::parse(const char* str, uint8_t out[16]) noexcept {
    if (!str || !out) return false;

    size_t len = strlen(str);
    bool dashed;

    if (len == 36) {
        dashed = true;
    } else if (len == 32) {
        dashed = false;
    } else {
        return false;
    }

    const char* p = str;
    uint8_t tmp[16];

    for (int i = 0; i < 16; i++) {
        // Byte indices 4, 6, 8, 10 start new groups (4-2-2-2-6 bytes)
        if (dashed && (i == 4 || i == 6 || i == 8 || i == 10)) {
            if (*p != '-') return false;
            p++;
        }

        int hi = hexValue(*p++);
        int lo = hexValue(*p++);
        if (hi < 0 || lo < 0) return false;

        tmp[i] = (uint8_t)((hi << 4) | lo);
    }

    memcpy(out, tmp, 16);
    return true;
}

UUIDVariant UUIDFormat::variantFromNibble(uint8_t nibble) noexcept {
    nibble &= 0x0F;
    if ((nibble & 0x08) == 0x00) return UUID_VARIANT_NCS;
    if ((nibble & 0x0C) == 0x08) return UUID_VARIANT_RFC4122;
    if ((nibble & 0x0E) == 0x0C) return UUID_VARIANT_MICROSOFT;
    return UUID_VARIANT_FUTURE;
}

const char* UUIDFormat::variantName(UUIDVariant variant) noexcept {
    switch (variant) {
        case UUID_VARIANT_NCS:       return "Reserved (NCS)";
        case UUID_VARIANT_RFC4122:   return "RFC 4122";
        case UUID_VARIANT_MICROSOFT: return "Microsoft";
        case UUID_VARIANT_FUTURE:    return "Reserved (Future)";
        case UUID_VARIANT_NONE:      return "";
    }
    return "";
}

#include "UUIDTimestamp.h"
#include "UUIDFormat.h"
#include "UUIDGen.h"

#include <stdio.h>

const char* const UUIDTimestamp::INVALID = "Invalid timestamp";
const char* const UUIDTimestamp::UNKNOWN = "Unknown format";

#define UUIDCODEC_MAX_INSTANT_MS 8640000000000000LL
#define UUIDCODEC_MS_PER_DAY 86400000LL

// Parse text[begin, end) as 1..maxDigits hex digits.
static bool parseHexRange(const std::string& text, size_t begin, size_t end, size_t maxDigits, uint64_t* out) {
    if (end <= begin || end - begin > maxDigits) return false;
    uint64_t v = 0;
    for (size_t i = begin; i < end; i++) {
        int d = UUIDFormat::hexValue(text[i]);
        if (d < 0) return false;
        v = (v << 4) | (uint64_t)d;
    }
    *out = v;
    return true;
}

static int64_t floorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) q--;
    return q;
}

// Days since 1970-01-01 to proleptic Gregorian y/m/d (Hinnant's civil_from_days).
static void civilFromDays(int64_t z, int64_t* y, unsigned* m, unsigned* d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = (unsigned)(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    *d = doy - (153 * mp + 2) / 5 + 1;
    *m = mp < 10 ? mp + 3 : mp - 9;
    *y = (int64_t)yoe + era * 400 + (*m <= 2 ? 1 : 0);
}

bool UUIDTimestamp::v1ToUnixMs(const std::string& raw, int64_t* outMs) noexcept {
    if (!outMs) return false;

    size_t first = raw.find('-');
    if (first == std::string::npos) return false;
    size_t second = raw.find('-', first + 1);
    if (second == std::string::npos) return false;
    if (raw.find('-', second + 1) != std::string::npos) return false;

    uint64_t time_low, time_mid, time_hi;
    if (!parseHexRange(raw, 0, first, 8, &time_low)) return false;
    if (!parseHexRange(raw, first + 1, second, 4, &time_mid)) return false;
    if (!parseHexRange(raw, second + 1, raw.size(), 4, &time_hi)) return false;

    uint64_t ticks = ((time_hi & 0x0FFF) << 48) | (time_mid << 32) | time_low;

    // ticks < 2^60, so the signed difference cannot overflow
    *outMs = floorDiv((int64_t)ticks - (int64_t)UUIDCODEC_GREGORIAN_OFFSET, 10000);
    return true;
}

bool UUIDTimestamp::v7ToUnixMs(const std::string& raw, int64_t* outMs) noexcept {
    if (!outMs) return false;
    uint64_t ms;
    if (!parseHexRange(raw, 0, raw.size(), 12, &ms)) return false;
    *outMs = (int64_t)ms;
    return true;
}

bool UUIDTimestamp::toISO8601(int64_t unixMs, std::string* out) {
    if (!out) return false;
    if (unixMs > UUIDCODEC_MAX_INSTANT_MS || unixMs < -UUIDCODEC_MAX_INSTANT_MS) return false;

    int64_t days = floorDiv(unixMs, UUIDCODEC_MS_PER_DAY);
    int64_t rem = unixMs - days * UUIDCODEC_MS_PER_DAY;

    int64_t year;
    unsigned month, day;
    civilFromDays(days, &year, &month, &day);

    unsigned hour = (unsigned)(rem / 3600000);
    unsigned minute = (unsigned)(rem / 60000 % 60);
    unsigned second = (unsigned)(rem / 1000 % 60);
    unsigned millis = (unsigned)(rem % 1000);

    char buf[40];
    int n;
    if (year >= 0 && year <= 9999) {
        n = snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02u:%02u:%02u.%03uZ",
                     (long long)year, month, day, hour, minute, second, millis);
    } else {
        long long abs_year = year < 0 ? -(long long)year : (long long)year;
        n = snprintf(buf, sizeof(buf), "%c%06lld-%02u-%02uT%02u:%02u:%02u.%03uZ",
                     year < 0 ? '-' : '+', abs_year, month, day, hour, minute, second, millis);
    }
    if (n < 0 || (size_t)n >= sizeof(buf)) return false;

    out->assign(buf, (size_t)n);
    return true;
}

std::string UUIDTimestamp::format(const std::string& raw, int version) {
    int64_t ms;
    switch (version) {
        case UUID_VERSION_1:
            if (!v1ToUnixMs(raw, &ms)) return INVALID;
            break;
        case UUID_VERSION_7:
            if (!v7ToUnixMs(raw, &ms)) return INVALID;
            break;
        default:
            return UNKNOWN;
    }

    std::string iso;
    if (!toISO8601(ms, &iso)) return INVALID;
    return iso;
}

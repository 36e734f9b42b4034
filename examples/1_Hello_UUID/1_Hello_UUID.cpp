/*
 * EXAMPLE 1: Hello UUID (Generate and Decode)
 *
 * Demonstrates:
 * 1. Generation of UUID v1, v4 and v7.
 * 2. Error handling (generate() returns false on RNG/clock failure).
 * 3. Text conversion: canonical, uppercase, raw hex.
 * 4. Decoding a value back into its fields and timestamp.
 */

#include <iostream>

#include "UUIDCodec.h"

static void printAnalysis(const UUIDAnalysis& a) {
    std::cout << "  version:   " << (int)a.version << "\n";
    std::cout << "  variant:   " << a.variantName() << "\n";
    if (a.hasTimestamp()) {
        std::cout << "  timestamp: " << a.timestampRaw
                  << " (" << UUIDTimestamp::format(a.timestampRaw, a.version) << ")\n";
    }
    if (a.hasClockSequence()) std::cout << "  clock seq: " << a.clockSequence << "\n";
    if (a.hasNode())          std::cout << "  node:      " << a.node << "\n";
    if (a.hasRandomBits())    std::cout << "  random:    " << a.randomBits << "\n";
}

int main() {
    UUIDLog::logger()->info("UUIDCodec {} hello example", UUIDCODEC_LIB_VERSION);

    const UUIDVersion versions[] = { UUID_VERSION_1, UUID_VERSION_4, UUID_VERSION_7 };
    UUIDGen uuid;

    for (UUIDVersion v : versions) {
        uuid.setVersion(v);

        // Always check the return value: generation fails if the
        // entropy source or the system clock is unavailable.
        if (!uuid.generate()) {
            UUIDLog::logger()->critical("Failed to generate UUID v{} (RNG/Clock Error)", (int)v);
            return 1;
        }

        char canonical[37];
        uuid.toString(canonical, sizeof(canonical));

        char custom[37];
        std::cout << "UUID v" << (int)v << ": " << canonical << "\n";
        uuid.toString(custom, sizeof(custom), true, true);
        std::cout << "  uppercase: " << custom << "\n";
        uuid.toString(custom, sizeof(custom), false, false);
        std::cout << "  raw hex:   " << custom << "\n";

        printAnalysis(UUIDDecoder::analyze(canonical));
    }

    return 0;
}

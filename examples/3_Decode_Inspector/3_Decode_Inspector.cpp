/*
 * EXAMPLE 3: Decode Inspector
 *
 * Prints the structure of every UUID given on the command line.
 * Any string is accepted: invalid input is reported, never rejected.
 *
 * Usage: 3_Decode_Inspector <uuid> [<uuid> ...]
 */

#include <iostream>
#include <string>

#include "UUIDCodec.h"

static void inspect(const std::string& input) {
    UUIDAnalysis a = UUIDDecoder::analyze(input);

    std::cout << "input:          " << input << "\n";
    if (!a.isValid) {
        std::cout << "valid:          no\n";
        std::cout << "hex:            " << a.hexString << "\n\n";
        return;
    }

    std::cout << "valid:          yes\n";
    std::cout << "canonical:      " << UUIDFormat::insertHyphens(a.hexString) << "\n";
    std::cout << "version:        " << (int)a.version << "\n";
    std::cout << "variant:        " << a.variantName() << "\n";
    if (a.hasTimestamp()) {
        std::cout << "timestamp raw:  " << a.timestampRaw << "\n";
        std::cout << "timestamp:      " << UUIDTimestamp::format(a.timestampRaw, a.version) << "\n";
    }
    if (a.hasClockSequence()) std::cout << "clock sequence: " << a.clockSequence << "\n";
    if (a.hasNode())          std::cout << "node:           " << a.node << "\n";
    if (a.hasRandomBits())    std::cout << "random bits:    " << a.randomBits << "\n";
    std::cout << "\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <uuid> [<uuid> ...]\n";
        return 2;
    }

    UUIDLog::logger()->debug("Inspecting {} value(s)", argc - 1);
    for (int i = 1; i < argc; i++) {
        inspect(argv[i]);
    }
    return 0;
}

#include "UUIDGen.h"
#include "UUIDLog.h"

#include <string.h>
#include <errno.h>
#include <sys/random.h>

#include <chrono>
#include <mutex>

static std::mutex _uuid_mutex;

// RAII Guard for Critical Sections
class UUIDGuard {
public:
    UUIDGuard() { _uuid_mutex.lock(); }
    ~UUIDGuard() { _uuid_mutex.unlock(); }

    // Disable copying
    UUIDGuard(const UUIDGuard&) = delete;
    UUIDGuard& operator=(const UUIDGuard&) = delete;
};

// --- CLASS IMPLEMENTATION ---

UUIDGen::UUIDGen(fill_random_fn rng, void* rng_ctx, now_ticks_fn now, void* now_ctx) noexcept
    : _version(UUID_VERSION_4),
      _rng(rng), _rng_ctx(rng_ctx), _now(now), _now_ctx(now_ctx),
      _v1Seeded(false), _clockSeq(0), _lastTicks(0)
{
    memset(_b, 0, sizeof(_b));
    memset(_node, 0, sizeof(_node));
}

bool UUIDGen::versionFromInt(int v, UUIDVersion* out) noexcept {
    if (!out) return false;
    switch (v) {
        case UUID_VERSION_1: *out = UUID_VERSION_1; return true;
        case UUID_VERSION_4: *out = UUID_VERSION_4; return true;
        case UUID_VERSION_7: *out = UUID_VERSION_7; return true;
        default: return false;
    }
}

bool UUIDGen::default_fill_random(uint8_t* dest, size_t len, void* ctx) noexcept {
    (void)ctx;
    size_t got = 0;
    while (got < len) {
        ssize_t n = getrandom(dest + got, len - got, 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        got += (size_t)n;
    }
    return true;
}

uint64_t UUIDGen::default_now_ticks(void* ctx) noexcept {
    (void)ctx;
    using namespace std::chrono;
    return (uint64_t)duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count() / 100;
}

bool UUIDGen::_fillChecked(uint8_t* dest, size_t len) {
    fill_random_fn rng = _rng ? _rng : &UUIDGen::default_fill_random;
    if (!rng(dest, len, _rng_ctx)) {
        UUIDLog::logger()->error("entropy source failed to deliver {} bytes", len);
        return false;
    }

    // Health check: a source stuck at zero is treated as broken
    uint8_t sum = 0;
    for (size_t i = 0; i < len; i++) sum |= dest[i];
    if (sum == 0) {
        UUIDLog::logger()->error("entropy source returned all-zero bytes");
        return false;
    }
    return true;
}

bool UUIDGen::generate() {
    switch (_version) {
        case UUID_VERSION_1: return _generateV1();
        case UUID_VERSION_4: return _generateV4();
        case UUID_VERSION_7: return _generateV7();
    }
    UUIDLog::logger()->error("unsupported UUID version {}", (int)_version);
    return false;
}

bool UUIDGen::_generateV4() {
    uint8_t temp_rand[16];
    if (!_fillChecked(temp_rand, sizeof(temp_rand))) return false;

    temp_rand[6] = (temp_rand[6] & 0x0F) | 0x40;
    temp_rand[8] = (temp_rand[8] & 0x3F) | 0x80;
    memcpy(_b, temp_rand, 16);
    return true;
}

bool UUIDGen::_generateV7() {
    now_ticks_fn now_func = _now ? _now : &UUIDGen::default_now_ticks;
    uint64_t now_ticks = now_func(_now_ctx);
    if (now_ticks == 0) {
        UUIDLog::logger()->error("time source unavailable");
        return false;
    }

    uint8_t temp_rand[16];
    if (!_fillChecked(temp_rand, sizeof(temp_rand))) return false;

    uint64_t ts = (now_ticks / 10000) & 0x0000FFFFFFFFFFFFULL;
    temp_rand[5] = (uint8_t)(ts & 0xFF); ts >>= 8;
    temp_rand[4] = (uint8_t)(ts & 0xFF); ts >>= 8;
    temp_rand[3] = (uint8_t)(ts & 0xFF); ts >>= 8;
    temp_rand[2] = (uint8_t)(ts & 0xFF); ts >>= 8;
    temp_rand[1] = (uint8_t)(ts & 0xFF); ts >>= 8;
    temp_rand[0] = (uint8_t)(ts & 0xFF);

    temp_rand[6] = (temp_rand[6] & 0x0F) | 0x70;
    temp_rand[8] = (temp_rand[8] & 0x3F) | 0x80;
    memcpy(_b, temp_rand, 16);
    return true;
}

bool UUIDGen::_generateV1() {
    now_ticks_fn now_func = _now ? _now : &UUIDGen::default_now_ticks;
    uint64_t now_ticks = now_func(_now_ctx);
    if (now_ticks == 0) {
        UUIDLog::logger()->error("time source unavailable");
        return false;
    }
    uint64_t ticks = (now_ticks + UUIDCODEC_GREGORIAN_OFFSET) & 0x0FFFFFFFFFFFFFFFULL;

    // Draw the clock sequence and node outside the lock
    bool seeded;
    {
        UUIDGuard lock;
        seeded = _v1Seeded;
    }
    uint8_t seed[8] = { 0 };
    if (!seeded && !_fillChecked(seed, sizeof(seed))) return false;

    uint16_t clock_seq;
    uint8_t node[6];
    bool seeded_now = false;
    bool bumped = false;
    {
        UUIDGuard lock;
        if (!_v1Seeded) {
            _clockSeq = (uint16_t)(((seed[0] << 8) | seed[1]) & 0x3FFF);
            memcpy(_node, seed + 2, 6);
            _node[0] |= 0x01; // multicast bit marks a non-MAC node
            _v1Seeded = true;
            seeded_now = true;
        } else if (ticks <= _lastTicks) {
            // Clock did not advance: change the clock sequence to stay unique
            _clockSeq = (uint16_t)((_clockSeq + 1) & 0x3FFF);
            bumped = true;
        }
        _lastTicks = ticks;
        clock_seq = _clockSeq;
        memcpy(node, _node, 6);
    }

    if (seeded_now) {
        UUIDLog::logger()->debug("v1 state seeded, clock sequence {:#06x}", clock_seq);
    }
    if (bumped) {
        UUIDLog::logger()->debug("v1 clock did not advance, clock sequence now {:#06x}", clock_seq);
    }

    uint32_t time_low = (uint32_t)(ticks & 0xFFFFFFFFULL);
    uint16_t time_mid = (uint16_t)((ticks >> 32) & 0xFFFF);
    uint16_t time_hi = (uint16_t)((ticks >> 48) & 0x0FFF);

    _b[0] = (uint8_t)(time_low >> 24);
    _b[1] = (uint8_t)(time_low >> 16);
    _b[2] = (uint8_t)(time_low >> 8);
    _b[3] = (uint8_t)(time_low);
    _b[4] = (uint8_t)(time_mid >> 8);
    _b[5] = (uint8_t)(time_mid);
    _b[6] = (uint8_t)(0x10 | (time_hi >> 8));
    _b[7] = (uint8_t)(time_hi);
    _b[8] = (uint8_t)(0x80 | ((clock_seq >> 8) & 0x3F));
    _b[9] = (uint8_t)(clock_seq & 0xFF);
    memcpy(_b + 10, node, 6);
    return true;
}

#pragma once

#include <cstdint>

namespace parley {

/**
 * Token bucket refilled at a per-minute rate, holding at most `burst`
 * tokens. Time comes from the caller. A rate of 0 disables the limit.
 * Not thread-safe.
 */
class TokenBucket {
public:
    TokenBucket();
    TokenBucket(uint32_t per_minute, uint32_t burst, uint64_t now_ms);

    // Takes one token; false when the bucket is empty
    bool try_take(uint64_t now_ms);

    bool enabled() const { return per_minute_ > 0; }
    uint32_t rejected() const { return rejected_; }

private:
    void refill(uint64_t now_ms);

    uint32_t per_minute_;
    // Scaled by 60000 so one token refills per (60000 / per_minute) ms without rounding
    uint64_t capacity_;
    uint64_t level_;
    uint64_t last_refill_ms_;
    uint32_t rejected_;
};

} // namespace parley

#include "utils/token_bucket.hpp"
#include <algorithm>

namespace parley {

static const uint64_t MS_PER_MINUTE = 60000;

TokenBucket::TokenBucket()
    : TokenBucket(0, 0, 0) {
}

TokenBucket::TokenBucket(uint32_t per_minute, uint32_t burst, uint64_t now_ms)
    : per_minute_(per_minute)
    , capacity_(static_cast<uint64_t>(std::max<uint32_t>(burst, 1)) * MS_PER_MINUTE)
    , level_(capacity_)
    , last_refill_ms_(now_ms)
    , rejected_(0) {
}

bool TokenBucket::try_take(uint64_t now_ms) {
    if (!enabled()) return true;

    refill(now_ms);
    if (level_ < MS_PER_MINUTE) {
        rejected_++;
        return false;
    }
    level_ -= MS_PER_MINUTE;
    return true;
}

void TokenBucket::refill(uint64_t now_ms) {
    if (now_ms <= last_refill_ms_) return;

    uint64_t elapsed = now_ms - last_refill_ms_;
    last_refill_ms_ = now_ms;
    // Long gaps fill the bucket; avoid overflow in the product
    if (elapsed >= MS_PER_MINUTE) {
        level_ = capacity_;
        return;
    }
    level_ = std::min(capacity_, level_ + elapsed * per_minute_);
}

} // namespace parley

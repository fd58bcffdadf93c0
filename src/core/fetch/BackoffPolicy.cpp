#include "core/fetch/BackoffPolicy.hpp"

#include <algorithm>

namespace core::fetch {

BackoffPolicy::BackoffPolicy(const FetchPolicy& policy, std::uint64_t seed)
    : min_(policy.backoffMin),
      max_(policy.backoffMax),
      jitterMax_(policy.jitterMax),
      settle_(policy.rotationSettle),
      courtesy_(policy.courtesyDelay),
      courtesyJitter_(policy.courtesyJitter),
      intervalPause_(policy.intervalPause),
      rng_(seed) {}

std::chrono::milliseconds BackoffPolicy::exponential(int attempt) const noexcept {
    if (attempt < 1) {
        attempt = 1;
    }
    auto wait = min_;
    for (int i = 1; i < attempt && wait < max_; ++i) {
        wait *= 2;
    }
    return std::min(wait, max_);
}

std::chrono::milliseconds BackoffPolicy::jitter(std::chrono::milliseconds upper) {
    if (upper.count() <= 0) {
        return std::chrono::milliseconds{0};
    }
    std::uniform_int_distribution<long long> pick(0, upper.count());
    return std::chrono::milliseconds{pick(rng_)};
}

std::chrono::milliseconds BackoffPolicy::delay(int attempt) { return exponential(attempt) + jitter(jitterMax_); }

std::chrono::milliseconds BackoffPolicy::wait_before_retry(const Decision& decision, int consecutiveErrors) {
    if (decision.exactWait) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(*decision.exactWait);
    }
    switch (decision.disposition) {
    case Disposition::RetrySame:
        return delay(consecutiveErrors);
    case Disposition::RotateAndRetry:
        return settle_;
    case Disposition::SkipWindow:
        return courtesy_delay();
    case Disposition::AbortAll:
        break;
    }
    return std::chrono::milliseconds{0};
}

std::chrono::milliseconds BackoffPolicy::courtesy_delay() { return courtesy_ + jitter(courtesyJitter_); }

}  // namespace core::fetch

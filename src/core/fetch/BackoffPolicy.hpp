#pragma once

#include <chrono>
#include <cstdint>
#include <random>

#include "core/fetch/ErrorClassifier.hpp"
#include "core/fetch/FetchPolicy.hpp"

namespace core::fetch {

// Decides every wait of a range fetch. The exponential term is
// min(max, min * 2^(n-1)); jitter is drawn uniformly from [0, jitterMax].
class BackoffPolicy {
public:
    BackoffPolicy(const FetchPolicy& policy, std::uint64_t seed);

    std::chrono::milliseconds exponential(int attempt) const noexcept;
    std::chrono::milliseconds delay(int attempt);

    // Wait after a failed attempt, given the decision taken for it and the
    // consecutive-error count at that point.
    std::chrono::milliseconds wait_before_retry(const Decision& decision, int consecutiveErrors);

    std::chrono::milliseconds courtesy_delay();
    std::chrono::milliseconds interval_pause() const noexcept { return intervalPause_; }

private:
    std::chrono::milliseconds jitter(std::chrono::milliseconds upper);

    std::chrono::milliseconds min_;
    std::chrono::milliseconds max_;
    std::chrono::milliseconds jitterMax_;
    std::chrono::milliseconds settle_;
    std::chrono::milliseconds courtesy_;
    std::chrono::milliseconds courtesyJitter_;
    std::chrono::milliseconds intervalPause_;
    std::mt19937_64 rng_;
};

}  // namespace core::fetch

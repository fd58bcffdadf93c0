#pragma once

#include <chrono>
#include <cstddef>

#include "domain/Types.h"

namespace core::fetch {

struct FetchPolicy {
    domain::TimestampMs chunkSpanMs = 6 * domain::kMillisPerHour;
    std::size_t rowLimit = 1000;

    int windowRetryBudget = 3;
    int totalRetryCeiling = 20;
    int rotateAfterConsecutive = 5;

    std::chrono::milliseconds backoffMin{std::chrono::seconds(1)};
    std::chrono::milliseconds backoffMax{std::chrono::seconds(30)};
    std::chrono::milliseconds jitterMax{std::chrono::seconds(1)};
    std::chrono::milliseconds rotationSettle{std::chrono::seconds(1)};
    std::chrono::milliseconds courtesyDelay{500};
    std::chrono::milliseconds courtesyJitter{250};
    std::chrono::milliseconds intervalPause{std::chrono::seconds(1)};

    // Throws std::invalid_argument naming the first inconsistent field.
    void validate() const;
};

}  // namespace core::fetch

#pragma once

#include <chrono>

#include "domain/Types.h"

namespace core::fetch {

// Time source and blocking wait used by the fetcher; tests substitute a
// clock that records waits instead of sleeping.
class Clock {
public:
    virtual ~Clock() = default;
    virtual domain::TimestampMs now_ms() const = 0;
    virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class SystemClock final : public Clock {
public:
    domain::TimestampMs now_ms() const override;
    void sleep_for(std::chrono::milliseconds duration) override;
};

}  // namespace core::fetch

#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "domain/Types.h"

namespace core::fetch {

class ChunkPlanner {
public:
    // Contiguous [start, end) windows of `span` ms, the last one clipped to
    // `end`. Empty when start >= end or span <= 0.
    static std::vector<domain::TimeWindow> plan(domain::TimestampMs start,
                                                domain::TimestampMs end,
                                                domain::TimestampMs span);

    // First window of plan(cursor, end, span), or std::nullopt when the
    // plan would be empty.
    static std::optional<domain::TimeWindow> next(domain::TimestampMs cursor,
                                                  domain::TimestampMs end,
                                                  domain::TimestampMs span) noexcept;

    // Clamps the configured span to [intervalMs, rowLimit * intervalMs].
    static domain::TimestampMs effective_span(domain::TimestampMs configured,
                                              domain::TimestampMs intervalMs,
                                              std::size_t rowLimit) noexcept;
};

}  // namespace core::fetch

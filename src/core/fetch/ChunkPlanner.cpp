#include "core/fetch/ChunkPlanner.hpp"

#include <algorithm>

namespace core::fetch {

std::vector<domain::TimeWindow> ChunkPlanner::plan(domain::TimestampMs start,
                                                   domain::TimestampMs end,
                                                   domain::TimestampMs span) {
    std::vector<domain::TimeWindow> windows;
    if (start >= end || span <= 0) {
        return windows;
    }

    windows.reserve(static_cast<std::size_t>((end - start + span - 1) / span));
    for (auto window = next(start, end, span); window; window = next(window->end, end, span)) {
        windows.push_back(*window);
    }
    return windows;
}

std::optional<domain::TimeWindow> ChunkPlanner::next(domain::TimestampMs cursor,
                                                     domain::TimestampMs end,
                                                     domain::TimestampMs span) noexcept {
    if (cursor >= end || span <= 0) {
        return std::nullopt;
    }
    // end - cursor keeps the addition from overflowing near the limits.
    return domain::TimeWindow{cursor, (end - cursor > span) ? cursor + span : end};
}

domain::TimestampMs ChunkPlanner::effective_span(domain::TimestampMs configured,
                                                 domain::TimestampMs intervalMs,
                                                 std::size_t rowLimit) noexcept {
    if (intervalMs <= 0) {
        return configured;
    }
    const auto cap = intervalMs * static_cast<domain::TimestampMs>(std::max<std::size_t>(rowLimit, 1));
    return std::clamp(configured, intervalMs, cap);
}

}  // namespace core::fetch

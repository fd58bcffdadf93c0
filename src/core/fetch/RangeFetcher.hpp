#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "core/fetch/BackoffPolicy.hpp"
#include "core/fetch/Clock.hpp"
#include "core/fetch/EndpointPool.hpp"
#include "core/fetch/ErrorClassifier.hpp"
#include "core/fetch/FetchErrors.hpp"
#include "core/fetch/FetchPolicy.hpp"
#include "domain/exchange/IKlinesSource.hpp"

namespace core::fetch {

// Counters of the last range fetch, kept for logging and tests.
struct FetchStats {
    int windowsPlanned = 0;
    int windowsFetched = 0;
    int windowsSkipped = 0;
    int attempts = 0;
    int totalRetries = 0;
    int rotations = 0;
    int forcedRotations = 0;
    int consecutiveErrors = 0;
    bool aborted = false;
};

// Downloads a time range window by window from a single-endpoint-at-a-time
// provider, retrying, rotating endpoints and skipping windows according to
// FetchPolicy. Not thread-safe; one instance serves one caller.
class RangeFetcher {
public:
    using ProgressCallback = std::function<void(std::size_t cumulativeRows)>;
    using CancelPredicate = std::function<bool()>;
    using IntervalPlan = std::vector<std::pair<std::string, int>>;

    RangeFetcher(domain::IKlinesSource& source,
                 std::vector<domain::Endpoint> endpoints,
                 FetchPolicy policy,
                 Clock& clock,
                 std::uint64_t seed);

    void set_progress_callback(ProgressCallback callback) { progress_ = std::move(callback); }
    void set_cancel_predicate(CancelPredicate predicate) { cancelled_ = std::move(predicate); }

    // Last `durationDays` days up to the clock's now. Throws
    // std::invalid_argument for an unknown interval or non-positive duration,
    // FetchFailed when nothing was retrieved, FetchCancelled on cancellation.
    std::vector<domain::Candle> fetch_range(const domain::Symbol& symbol,
                                            const std::string& interval,
                                            int durationDays);

    std::vector<domain::Candle> fetch_between(const domain::Symbol& symbol,
                                              const std::string& interval,
                                              domain::TimestampMs startMs,
                                              domain::TimestampMs endMs);

    // Runs fetch_range per entry. Intervals that fail are logged and left out
    // of the result; cancellation still propagates.
    std::map<std::string, std::vector<domain::Candle>> fetch_multiple(const domain::Symbol& symbol,
                                                                      const IntervalPlan& plan);

    const EndpointPool& pool() const noexcept { return pool_; }
    const FetchStats& last_stats() const noexcept { return stats_; }
    const FetchPolicy& policy() const noexcept { return policy_; }

private:
    struct FetchSession {
        int consecutiveErrors = 0;
        int totalRetries = 0;
    };

    enum class WindowOutcome {
        Completed,
        Skipped,
        Aborted,
    };

    WindowOutcome run_window(FetchSession& session,
                             const domain::KlinesRequest& request,
                             std::vector<domain::Candle>& rows,
                             domain::TimestampMs& cursor);

    bool cancel_requested() const;

    domain::IKlinesSource& source_;
    FetchPolicy policy_;
    Clock& clock_;
    EndpointPool pool_;
    BackoffPolicy backoff_;
    ErrorClassifier classifier_;
    ProgressCallback progress_;
    CancelPredicate cancelled_;
    FetchStats stats_;
};

}  // namespace core::fetch

#include "core/fetch/RangeFetcher.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include "common/Log.hpp"
#include "core/fetch/ChunkPlanner.hpp"
#include "domain/exchange/Interval.hpp"

namespace core::fetch {
namespace {

constexpr std::uint64_t kBackoffSeedSalt = 0x9E3779B97F4A7C15ULL;

FetchPolicy validated(FetchPolicy policy) {
    policy.validate();
    return policy;
}

std::string describe(const domain::FetchError& error) {
    std::string text = domain::to_string(error.kind);
    if (error.kind == domain::FetchErrorKind::HttpStatus) {
        text += " " + std::to_string(error.httpStatus);
    }
    if (!error.message.empty()) {
        text += ": " + error.message;
    }
    return text;
}

void append_rows(std::vector<domain::Candle>& rows, std::vector<domain::Candle> batch) {
    std::sort(batch.begin(), batch.end(), [](const domain::Candle& lhs, const domain::Candle& rhs) {
        return lhs.openTime < rhs.openTime;
    });
    for (auto& candle : batch) {
        if (!rows.empty() && candle.openTime <= rows.back().openTime) {
            continue;
        }
        rows.push_back(std::move(candle));
    }
}

}  // namespace

RangeFetcher::RangeFetcher(domain::IKlinesSource& source,
                           std::vector<domain::Endpoint> endpoints,
                           FetchPolicy policy,
                           Clock& clock,
                           std::uint64_t seed)
    : source_(source),
      policy_(validated(std::move(policy))),
      clock_(clock),
      pool_(std::move(endpoints), seed),
      backoff_(policy_, seed ^ kBackoffSeedSalt) {}

bool RangeFetcher::cancel_requested() const {
    return cancelled_ && cancelled_();
}

std::vector<domain::Candle> RangeFetcher::fetch_range(const domain::Symbol& symbol,
                                                      const std::string& interval,
                                                      int durationDays) {
    if (durationDays <= 0) {
        throw std::invalid_argument("Duration must be at least one day, got " + std::to_string(durationDays));
    }
    // Validate before touching the clock so a bad literal fails fast.
    domain::interval_from_string(interval);

    const auto endMs = clock_.now_ms();
    const auto startMs = endMs - static_cast<domain::TimestampMs>(durationDays) * domain::kMillisPerDay;
    return fetch_between(symbol, interval, startMs, endMs);
}

std::vector<domain::Candle> RangeFetcher::fetch_between(const domain::Symbol& symbol,
                                                        const std::string& interval,
                                                        domain::TimestampMs startMs,
                                                        domain::TimestampMs endMs) {
    const auto intervalValue = domain::interval_from_string(interval);
    if (symbol.empty()) {
        throw std::invalid_argument("Symbol must not be empty");
    }

    stats_ = FetchStats{};
    const auto span = ChunkPlanner::effective_span(policy_.chunkSpanMs, intervalValue.ms, policy_.rowLimit);
    const auto windows = ChunkPlanner::plan(startMs, endMs, span);
    stats_.windowsPlanned = static_cast<int>(windows.size());

    LOG_INFO("Fetching " << symbol << " " << interval << " in " << windows.size() << " windows of "
                         << span / domain::kMillisPerMinute << " min from " << pool_.current().host);

    FetchSession session;
    std::vector<domain::Candle> rows;
    auto cursor = startMs;

    // Windows are re-planned from the cursor so a short response resumes
    // right after its last open time.
    for (auto window = ChunkPlanner::next(cursor, endMs, span); window;
         window = ChunkPlanner::next(cursor, endMs, span)) {
        if (cancel_requested()) {
            LOG_WARN("Fetch of " << symbol << " " << interval << " cancelled with " << rows.size() << " rows");
            throw FetchCancelled(std::move(rows));
        }

        domain::KlinesRequest request;
        request.symbol = symbol;
        request.interval = interval;
        request.startMs = window->start;
        request.endMs = window->end;
        request.limit = policy_.rowLimit;

        const auto outcome = run_window(session, request, rows, cursor);
        if (outcome == WindowOutcome::Skipped) {
            cursor = std::max(cursor, window->end + 1);
        } else if (outcome == WindowOutcome::Aborted) {
            stats_.aborted = true;
            break;
        }
    }

    stats_.consecutiveErrors = session.consecutiveErrors;
    stats_.totalRetries = session.totalRetries;

    if (rows.empty()) {
        throw FetchFailed(symbol, interval, stats_.attempts,
                          stats_.aborted ? "retry ceiling reached or request rejected" : "every window was empty or skipped");
    }

    LOG_INFO("Fetched " << rows.size() << " candles for " << symbol << " " << interval << " ("
                        << stats_.windowsFetched << " windows ok, " << stats_.windowsSkipped << " skipped, "
                        << session.totalRetries << " retries)");
    return rows;
}

RangeFetcher::WindowOutcome RangeFetcher::run_window(FetchSession& session,
                                                     const domain::KlinesRequest& request,
                                                     std::vector<domain::Candle>& rows,
                                                     domain::TimestampMs& cursor) {
    int failures = 0;
    int malformed = 0;

    while (true) {
        if (cancel_requested()) {
            throw FetchCancelled(std::move(rows));
        }

        const auto endpoint = pool_.current();
        ++stats_.attempts;
        domain::KlinesAttempt attempt;
        try {
            attempt = source_.fetch_klines(endpoint, request);
        } catch (const std::exception& ex) {
            domain::FetchError error;
            error.kind = domain::FetchErrorKind::Other;
            error.message = std::string{"provider threw: "} + ex.what();
            attempt = domain::KlinesAttempt::failure(std::move(error));
        }

        if (attempt.ok()) {
            const bool emptyBatch = attempt.rows.empty();
            domain::TimestampMs maxOpen = 0;
            for (const auto& candle : attempt.rows) {
                maxOpen = std::max(maxOpen, candle.openTime);
            }
            append_rows(rows, std::move(attempt.rows));
            // A batch with nothing at or after the request start still moves
            // the cursor past the window.
            const bool behindStart = emptyBatch || maxOpen < request.startMs;
            cursor = std::max(cursor, behindStart ? request.endMs + 1 : maxOpen + 1);

            session.consecutiveErrors = 0;
            stats_.consecutiveErrors = 0;
            ++stats_.windowsFetched;
            if (progress_) {
                progress_(rows.size());
            }
            clock_.sleep_for(backoff_.courtesy_delay());
            return WindowOutcome::Completed;
        }

        const auto& error = *attempt.error;
        auto decision = classifier_.classify(error, malformed);
        if (error.kind == domain::FetchErrorKind::MalformedBody) {
            ++malformed;
        }
        ++failures;
        ++session.consecutiveErrors;
        ++session.totalRetries;
        stats_.consecutiveErrors = session.consecutiveErrors;
        stats_.totalRetries = session.totalRetries;

        LOG_WARN("Attempt on " << endpoint.host << " for [" << request.startMs << ", " << request.endMs
                               << "] failed (" << describe(error) << "), " << to_string(decision.disposition)
                               << ", consecutive=" << session.consecutiveErrors
                               << " total=" << session.totalRetries);

        if (session.totalRetries >= policy_.totalRetryCeiling) {
            LOG_ERR("Retry ceiling of " << policy_.totalRetryCeiling << " reached, stopping with " << rows.size()
                                        << " rows");
            return WindowOutcome::Aborted;
        }
        if (decision.disposition == Disposition::AbortAll) {
            LOG_ERR("Provider rejected the request (" << describe(error) << "), stopping");
            return WindowOutcome::Aborted;
        }

        // The threshold rotates whatever the classification; only RETRY_SAME
        // is promoted, a skip still skips.
        const bool forced = session.consecutiveErrors >= policy_.rotateAfterConsecutive;
        if (forced && decision.disposition == Disposition::RetrySame) {
            decision.disposition = Disposition::RotateAndRetry;
        }

        if (forced || decision.disposition == Disposition::RotateAndRetry) {
            pool_.rotate();
            ++stats_.rotations;
            if (forced) {
                ++stats_.forcedRotations;
                session.consecutiveErrors = 0;
                stats_.consecutiveErrors = 0;
            }
        }

        const bool exhausted =
            decision.disposition != Disposition::SkipWindow && failures >= policy_.windowRetryBudget;
        clock_.sleep_for(backoff_.wait_before_retry(decision, session.consecutiveErrors));

        if (decision.disposition == Disposition::SkipWindow || exhausted) {
            LOG_WARN("Skipping window [" << request.startMs << ", " << request.endMs << "] after " << failures
                                         << " failed attempts");
            ++stats_.windowsSkipped;
            return WindowOutcome::Skipped;
        }
    }
}

std::map<std::string, std::vector<domain::Candle>> RangeFetcher::fetch_multiple(const domain::Symbol& symbol,
                                                                                const IntervalPlan& plan) {
    std::map<std::string, std::vector<domain::Candle>> results;
    for (std::size_t i = 0; i < plan.size(); ++i) {
        const auto& [interval, days] = plan[i];
        try {
            results[interval] = fetch_range(symbol, interval, days);
        } catch (const FetchFailed& ex) {
            LOG_ERR("Interval " << interval << " failed: " << ex.what());
        } catch (const std::invalid_argument& ex) {
            LOG_ERR("Interval " << interval << " rejected: " << ex.what());
        }

        if (i + 1 < plan.size() && !cancel_requested()) {
            clock_.sleep_for(backoff_.interval_pause());
        }
    }
    return results;
}

}  // namespace core::fetch

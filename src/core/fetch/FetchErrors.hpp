#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "domain/Types.h"

namespace core::fetch {

// The whole range fetch ended without a single row.
class FetchFailed : public std::runtime_error {
public:
    FetchFailed(std::string symbol, std::string interval, int attempts, const std::string& reason)
        : std::runtime_error("No candles retrieved for " + symbol + " " + interval + " after " +
                             std::to_string(attempts) + " attempts: " + reason),
          symbol_(std::move(symbol)),
          interval_(std::move(interval)),
          attempts_(attempts) {}

    const std::string& symbol() const noexcept { return symbol_; }
    const std::string& interval() const noexcept { return interval_; }
    int attempts() const noexcept { return attempts_; }

private:
    std::string symbol_;
    std::string interval_;
    int attempts_;
};

// Raised between windows once cancellation was requested. Carries the rows
// gathered so far; whether to keep them is the caller's decision.
class FetchCancelled : public std::runtime_error {
public:
    explicit FetchCancelled(std::vector<domain::Candle> partial)
        : std::runtime_error("Range fetch cancelled"), partial_(std::move(partial)) {}

    const std::vector<domain::Candle>& partial() const noexcept { return partial_; }

private:
    std::vector<domain::Candle> partial_;
};

}  // namespace core::fetch

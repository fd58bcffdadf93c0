#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "domain/Types.h"

namespace domain {

enum class FetchErrorKind {
    ConnectTimeout,
    ReadTimeout,
    ConnectionReset,
    DnsFailure,
    HttpStatus,
    MalformedBody,
    Other,
};

const char* to_string(FetchErrorKind kind) noexcept;

struct FetchError {
    FetchErrorKind kind{FetchErrorKind::Other};
    unsigned httpStatus{0};
    std::optional<std::chrono::seconds> retryAfter;
    std::string message;
};

struct KlinesRequest {
    Symbol symbol;
    std::string interval;
    TimestampMs startMs{0};
    // Inclusive upper bound, as the provider interprets endTime.
    TimestampMs endMs{0};
    std::size_t limit{1000};
};

struct KlinesAttempt {
    std::vector<Candle> rows;
    std::optional<FetchError> error;

    bool ok() const noexcept { return !error.has_value(); }

    static KlinesAttempt success(std::vector<Candle> rows) {
        KlinesAttempt attempt;
        attempt.rows = std::move(rows);
        return attempt;
    }

    static KlinesAttempt failure(FetchError error) {
        KlinesAttempt attempt;
        attempt.error = std::move(error);
        return attempt;
    }
};

// One attempt at one window on one endpoint. Implementations report every
// failure through KlinesAttempt::error and do not throw for transport or
// protocol problems.
class IKlinesSource {
 public:
  virtual ~IKlinesSource() = default;
  virtual KlinesAttempt fetch_klines(const Endpoint& endpoint, const KlinesRequest& request) = 0;
};

}  // namespace domain

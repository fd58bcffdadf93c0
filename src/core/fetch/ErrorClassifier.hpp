#pragma once

#include <chrono>
#include <optional>

#include "domain/exchange/IKlinesSource.hpp"

namespace core::fetch {

enum class Disposition {
    RetrySame,
    RotateAndRetry,
    SkipWindow,
    AbortAll,
};

const char* to_string(Disposition disposition) noexcept;

struct Decision {
    Disposition disposition{Disposition::RetrySame};
    // Set when the provider dictated the wait (Retry-After); overrides backoff.
    std::optional<std::chrono::seconds> exactWait;
};

class ErrorClassifier {
public:
    // `malformedInWindow` counts malformed bodies already seen for the current
    // window, excluding `error` itself.
    [[nodiscard]] Decision classify(const domain::FetchError& error, int malformedInWindow) const;
};

}  // namespace core::fetch

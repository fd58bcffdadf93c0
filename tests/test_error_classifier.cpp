#include <chrono>
#include <iostream>

#include "core/fetch/ErrorClassifier.hpp"

using core::fetch::Disposition;
using core::fetch::ErrorClassifier;
using domain::FetchError;
using domain::FetchErrorKind;

namespace {

FetchError status(unsigned code) {
    FetchError error;
    error.kind = FetchErrorKind::HttpStatus;
    error.httpStatus = code;
    return error;
}

FetchError kind(FetchErrorKind value) {
    FetchError error;
    error.kind = value;
    return error;
}

}  // namespace

int main() {
    const ErrorClassifier classifier{};

    for (const auto transient : {FetchErrorKind::ConnectTimeout, FetchErrorKind::ReadTimeout,
                                 FetchErrorKind::ConnectionReset, FetchErrorKind::DnsFailure,
                                 FetchErrorKind::Other}) {
        const auto decision = classifier.classify(kind(transient), 0);
        if (decision.disposition != Disposition::RetrySame || decision.exactWait) {
            std::cerr << "Transport error " << domain::to_string(transient) << " must retry the same endpoint\n";
            return 1;
        }
    }

    for (const unsigned code : {500U, 502U, 503U, 504U, 520U, 522U, 525U, 418U, 409U}) {
        if (classifier.classify(status(code), 0).disposition != Disposition::RetrySame) {
            std::cerr << "HTTP " << code << " must retry the same endpoint\n";
            return 1;
        }
    }

    for (const unsigned code : {403U, 451U}) {
        if (classifier.classify(status(code), 0).disposition != Disposition::RotateAndRetry) {
            std::cerr << "HTTP " << code << " must rotate the endpoint\n";
            return 1;
        }
    }

    for (const unsigned code : {400U, 404U}) {
        if (classifier.classify(status(code), 0).disposition != Disposition::AbortAll) {
            std::cerr << "HTTP " << code << " must abort the fetch\n";
            return 1;
        }
    }

    {
        auto limited = status(429);
        limited.retryAfter = std::chrono::seconds(7);
        const auto decision = classifier.classify(limited, 0);
        if (decision.disposition != Disposition::RetrySame || !decision.exactWait ||
            *decision.exactWait != std::chrono::seconds(7)) {
            std::cerr << "HTTP 429 with Retry-After: 7 must wait exactly 7 s\n";
            return 1;
        }

        const auto withoutHeader = classifier.classify(status(429), 0);
        if (withoutHeader.disposition != Disposition::RetrySame || withoutHeader.exactWait) {
            std::cerr << "HTTP 429 without Retry-After must fall back to backoff\n";
            return 1;
        }
    }

    {
        const auto malformed = kind(FetchErrorKind::MalformedBody);
        if (classifier.classify(malformed, 0).disposition != Disposition::RetrySame) {
            std::cerr << "First malformed body in a window must be retried\n";
            return 1;
        }
        if (classifier.classify(malformed, 1).disposition != Disposition::SkipWindow ||
            classifier.classify(malformed, 4).disposition != Disposition::SkipWindow) {
            std::cerr << "Repeated malformed body must skip the window\n";
            return 1;
        }
    }

    return 0;
}

#include "core/fetch/ErrorClassifier.hpp"

namespace core::fetch {

const char* to_string(Disposition disposition) noexcept {
    switch (disposition) {
    case Disposition::RetrySame:
        return "retry-same";
    case Disposition::RotateAndRetry:
        return "rotate-and-retry";
    case Disposition::SkipWindow:
        return "skip-window";
    case Disposition::AbortAll:
        return "abort-all";
    }
    return "retry-same";
}

Decision ErrorClassifier::classify(const domain::FetchError& error, int malformedInWindow) const {
    using domain::FetchErrorKind;

    switch (error.kind) {
    case FetchErrorKind::ConnectTimeout:
    case FetchErrorKind::ReadTimeout:
    case FetchErrorKind::ConnectionReset:
    case FetchErrorKind::DnsFailure:
        return {Disposition::RetrySame, std::nullopt};

    case FetchErrorKind::MalformedBody:
        return {malformedInWindow == 0 ? Disposition::RetrySame : Disposition::SkipWindow, std::nullopt};

    case FetchErrorKind::HttpStatus: {
        const auto status = error.httpStatus;
        if (status == 429U) {
            return {Disposition::RetrySame, error.retryAfter};
        }
        if (status == 403U || status == 451U) {
            return {Disposition::RotateAndRetry, std::nullopt};
        }
        // The request itself is rejected; every window would fail the same way.
        if (status == 400U || status == 404U) {
            return {Disposition::AbortAll, std::nullopt};
        }
        return {Disposition::RetrySame, std::nullopt};
    }

    case FetchErrorKind::Other:
        break;
    }
    return {Disposition::RetrySame, std::nullopt};
}

}  // namespace core::fetch

#include "adapters/binance/BinanceKlinesSource.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <utility>

#include "adapters/binance/KlineParser.hpp"
#include "common/Log.hpp"

namespace adapters::binance {
namespace {

constexpr const char* kSpotPath = "/api/v3/klines";
constexpr const char* kFuturesPath = "/fapi/v1/klines";

domain::FetchErrorKind from_transport(infra::http::TransportError error) {
    using infra::http::TransportError;
    switch (error) {
    case TransportError::DnsFailure:
        return domain::FetchErrorKind::DnsFailure;
    case TransportError::ConnectTimeout:
        return domain::FetchErrorKind::ConnectTimeout;
    case TransportError::ReadTimeout:
        return domain::FetchErrorKind::ReadTimeout;
    case TransportError::ConnectRefused:
    case TransportError::ConnectionReset:
        return domain::FetchErrorKind::ConnectionReset;
    default:
        return domain::FetchErrorKind::Other;
    }
}

std::string snippet(const std::string& body) {
    constexpr std::size_t kMaxSnippet = 160;
    if (body.size() <= kMaxSnippet) {
        return body;
    }
    return body.substr(0, kMaxSnippet) + "...";
}

}  // namespace

BinanceKlinesSource::BinanceKlinesSource(Options options)
    : options_(std::move(options)), headers_(options_.seed) {}

std::vector<domain::Endpoint> BinanceKlinesSource::default_endpoints() {
    using domain::MarketType;
    return {
        {"api.binance.com", MarketType::Spot},
        {"api1.binance.com", MarketType::Spot},
        {"api2.binance.com", MarketType::Spot},
        {"api3.binance.com", MarketType::Spot},
        {"api4.binance.com", MarketType::Spot},
        {"data-api.binance.vision", MarketType::Spot},
        {"fapi.binance.com", MarketType::Futures},
    };
}

std::string BinanceKlinesSource::request_target(domain::MarketType market, const domain::KlinesRequest& request) {
    const auto limit = std::clamp<std::size_t>(request.limit == 0 ? kMaxLimit : request.limit, 1, kMaxLimit);

    std::ostringstream target;
    target << (market == domain::MarketType::Futures ? kFuturesPath : kSpotPath) << "?symbol=" << request.symbol
           << "&interval=" << request.interval << "&startTime=" << request.startMs << "&endTime=" << request.endMs
           << "&limit=" << limit;
    return target.str();
}

std::optional<std::chrono::seconds> BinanceKlinesSource::parse_retry_after(const std::string& header) {
    std::string value;
    for (const char ch : header) {
        if (std::isspace(static_cast<unsigned char>(ch)) == 0) {
            value.push_back(ch);
        }
    }
    // HTTP-date values are not honoured; the caller falls back to backoff.
    if (value.empty() || value.size() > 9 ||
        !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    return std::chrono::seconds(std::stoll(value));
}

domain::KlinesAttempt BinanceKlinesSource::to_attempt(const infra::http::HttpResponse& response) {
    if (!response.transportOk()) {
        domain::FetchError error{};
        error.kind = from_transport(response.error);
        error.message = response.errorMessage;
        return domain::KlinesAttempt::failure(std::move(error));
    }

    if (response.status != 200U) {
        domain::FetchError error{};
        error.kind = domain::FetchErrorKind::HttpStatus;
        error.httpStatus = response.status;
        error.retryAfter = parse_retry_after(response.retryAfterHeader);
        error.message = "HTTP " + std::to_string(response.status) + " from " + response.finalHost + ": " +
                        snippet(response.body);
        return domain::KlinesAttempt::failure(std::move(error));
    }

    try {
        return domain::KlinesAttempt::success(parse_klines(response.body));
    } catch (const KlineParseError& ex) {
        domain::FetchError error{};
        error.kind = domain::FetchErrorKind::MalformedBody;
        error.httpStatus = response.status;
        error.message = ex.what();
        return domain::KlinesAttempt::failure(std::move(error));
    }
}

domain::KlinesAttempt BinanceKlinesSource::fetch_klines(const domain::Endpoint& endpoint,
                                                        const domain::KlinesRequest& request) {
    const auto target = request_target(endpoint.market, request);

    infra::http::RequestOptions requestOptions{};
    requestOptions.connectTimeout = options_.connectTimeout;
    requestOptions.readTimeout = options_.readTimeout;
    requestOptions.proxy = options_.proxy;
    requestOptions.headers = headers_.next();

    LOG_DEBUG("Binance REST " << endpoint.host << target);
    const auto response = infra::http::https_get(endpoint.host, target, requestOptions);
    if (!response.usedWeightHeader.empty()) {
        LOG_DEBUG("Binance REST used weight " << response.usedWeightHeader << " on " << endpoint.host);
    }
    return to_attempt(response);
}

}  // namespace adapters::binance

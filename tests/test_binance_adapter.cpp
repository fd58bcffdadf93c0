#include <chrono>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>

#include "adapters/binance/BinanceKlinesSource.hpp"
#include "adapters/binance/KlineParser.hpp"
#include "adapters/binance/RequestHeaders.hpp"
#include "infra/http/TlsHttpClient.hpp"

using adapters::binance::BinanceKlinesSource;
using adapters::binance::KlineParseError;
using adapters::binance::parse_klines;

namespace {

bool throwsParseError(const std::string& body) {
    try {
        parse_klines(body);
    } catch (const KlineParseError&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    {
        const std::string body =
            R"([[1700000000000,"37000.10","37100.00","36950.5","37050.25","12.5",1700001799999,"462500.75",321,"6.1","225000.0","0"],)"
            R"([1700001800000,37050.25,37060,37010,37020,3.25,1700003599999]])";
        const auto rows = parse_klines(body);
        if (rows.size() != 2U) {
            std::cerr << "Expected 2 rows but got " << rows.size() << "\n";
            return 1;
        }
        const auto& first = rows[0];
        if (first.openTime != 1700000000000LL || first.closeTime != 1700001799999LL || first.open != 37000.10 ||
            first.high != 37100.0 || first.low != 36950.5 || first.close != 37050.25 || first.baseVolume != 12.5 ||
            first.quoteVolume != 462500.75 || first.trades != 321) {
            std::cerr << "First row decoded incorrectly\n";
            return 1;
        }
        const auto& second = rows[1];
        if (second.open != 37050.25 || second.high != 37060.0 || second.quoteVolume != 0.0 || second.trades != 0) {
            std::cerr << "Numeric columns and missing optional columns must decode\n";
            return 1;
        }
        if (!parse_klines("[]").empty()) {
            std::cerr << "Empty array must yield no rows\n";
            return 1;
        }
    }

    for (const char* bad : {"", "not json", R"({"code":-1121,"msg":"Invalid symbol."})", "[1,2,3]",
                            R"([[1700000000000,"1","2","3"]])", R"([[1700000000000,"x","2","3","4","5",1700000000001]])",
                            R"([[1700000000000,"1","2","3","4","5",1600000000000]])"}) {
        if (!throwsParseError(bad)) {
            std::cerr << "Body must be rejected: " << bad << "\n";
            return 1;
        }
    }

    try {
        parse_klines(R"({"code":-1121,"msg":"Invalid symbol."})");
    } catch (const KlineParseError& ex) {
        if (std::string{ex.what()}.find("Invalid symbol.") == std::string::npos) {
            std::cerr << "Provider error message must be carried: " << ex.what() << "\n";
            return 1;
        }
    }

    {
        domain::KlinesRequest request;
        request.symbol = "BTCUSDT";
        request.interval = "30m";
        request.startMs = 1000;
        request.endMs = 2000;
        request.limit = 5000;
        if (BinanceKlinesSource::request_target(domain::MarketType::Spot, request) !=
            "/api/v3/klines?symbol=BTCUSDT&interval=30m&startTime=1000&endTime=2000&limit=1000") {
            std::cerr << "Unexpected spot target\n";
            return 1;
        }
        request.limit = 10;
        if (BinanceKlinesSource::request_target(domain::MarketType::Futures, request) !=
            "/fapi/v1/klines?symbol=BTCUSDT&interval=30m&startTime=1000&endTime=2000&limit=10") {
            std::cerr << "Unexpected futures target\n";
            return 1;
        }
    }

    {
        if (BinanceKlinesSource::parse_retry_after(" 7 ") != std::chrono::seconds(7) ||
            BinanceKlinesSource::parse_retry_after("").has_value() ||
            BinanceKlinesSource::parse_retry_after("Wed, 21 Oct 2015 07:28:00 GMT").has_value()) {
            std::cerr << "Retry-After must accept delta-seconds only\n";
            return 1;
        }
    }

    {
        infra::http::HttpResponse timeout;
        timeout.error = infra::http::TransportError::ReadTimeout;
        auto attempt = BinanceKlinesSource::to_attempt(timeout);
        if (attempt.ok() || attempt.error->kind != domain::FetchErrorKind::ReadTimeout) {
            std::cerr << "Read timeout must map to ReadTimeout\n";
            return 1;
        }

        infra::http::HttpResponse refused;
        refused.error = infra::http::TransportError::ConnectRefused;
        attempt = BinanceKlinesSource::to_attempt(refused);
        if (attempt.ok() || attempt.error->kind != domain::FetchErrorKind::ConnectionReset) {
            std::cerr << "Refused connection must map to ConnectionReset\n";
            return 1;
        }

        infra::http::HttpResponse limited;
        limited.status = 429;
        limited.retryAfterHeader = "7";
        limited.body = R"({"code":-1003,"msg":"Too many requests"})";
        attempt = BinanceKlinesSource::to_attempt(limited);
        if (attempt.ok() || attempt.error->kind != domain::FetchErrorKind::HttpStatus ||
            attempt.error->httpStatus != 429U || attempt.error->retryAfter != std::chrono::seconds(7)) {
            std::cerr << "429 must carry status and Retry-After\n";
            return 1;
        }

        infra::http::HttpResponse garbage;
        garbage.status = 200;
        garbage.body = "<html>blocked</html>";
        attempt = BinanceKlinesSource::to_attempt(garbage);
        if (attempt.ok() || attempt.error->kind != domain::FetchErrorKind::MalformedBody) {
            std::cerr << "Undecodable 200 body must map to MalformedBody\n";
            return 1;
        }

        infra::http::HttpResponse good;
        good.status = 200;
        good.body = R"([[1700000000000,"1","2","0.5","1.5","10",1700000059999,"15",4]])";
        attempt = BinanceKlinesSource::to_attempt(good);
        if (!attempt.ok() || attempt.rows.size() != 1U) {
            std::cerr << "Valid 200 body must map to rows\n";
            return 1;
        }
    }

    {
        const auto endpoints = BinanceKlinesSource::default_endpoints();
        int futures = 0;
        for (const auto& endpoint : endpoints) {
            futures += endpoint.market == domain::MarketType::Futures ? 1 : 0;
        }
        if (endpoints.size() < 3U || futures != 1 || endpoints.front().host != "api.binance.com") {
            std::cerr << "Default endpoints must start with api.binance.com and include one futures host\n";
            return 1;
        }
    }

    {
        adapters::binance::RequestHeaders headers(17);
        std::set<std::string> agents;
        for (int i = 0; i < 40; ++i) {
            const auto list = headers.next();
            bool hasAccept = false;
            for (const auto& [name, value] : list) {
                if (name == "User-Agent") {
                    agents.insert(value);
                }
                hasAccept = hasAccept || (name == "Accept-Language" && !value.empty());
            }
            if (!hasAccept) {
                std::cerr << "Every header set must carry Accept-Language\n";
                return 1;
            }
        }
        if (agents.size() < 2U) {
            std::cerr << "User agent must vary across attempts\n";
            return 1;
        }
    }

    {
        infra::http::RequestOptions options;
        try {
            infra::http::https_get("", "/", options);
            std::cerr << "Empty host must be rejected\n";
            return 1;
        } catch (const std::invalid_argument&) {
        }

        const auto proxy = infra::http::ProxyConfig::parse("http://10.0.0.1:3128");
        if (!proxy || proxy->host != "10.0.0.1" || proxy->port != "3128") {
            std::cerr << "Proxy URL must be split into host and port\n";
            return 1;
        }
        if (infra::http::ProxyConfig::parse("").has_value()) {
            std::cerr << "Empty proxy must be rejected\n";
            return 1;
        }
    }

    return 0;
}

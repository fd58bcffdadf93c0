#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "adapters/binance/RequestHeaders.hpp"
#include "domain/exchange/IKlinesSource.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace adapters::binance {

class BinanceKlinesSource : public domain::IKlinesSource {
public:
    struct Options {
        std::chrono::milliseconds connectTimeout{std::chrono::seconds(10)};
        std::chrono::milliseconds readTimeout{std::chrono::seconds(30)};
        std::optional<infra::http::ProxyConfig> proxy;
        std::uint64_t seed{0};
    };

    explicit BinanceKlinesSource(Options options);
    ~BinanceKlinesSource() override = default;

    domain::KlinesAttempt fetch_klines(const domain::Endpoint& endpoint,
                                       const domain::KlinesRequest& request) override;

    static constexpr std::size_t kMaxLimit = 1000;

    // Standard spot host, its numbered mirrors, the public market-data mirror
    // and the USD-M futures host.
    static std::vector<domain::Endpoint> default_endpoints();

    static std::string request_target(domain::MarketType market, const domain::KlinesRequest& request);
    static domain::KlinesAttempt to_attempt(const infra::http::HttpResponse& response);
    static std::optional<std::chrono::seconds> parse_retry_after(const std::string& header);

private:
    Options options_;
    RequestHeaders headers_;
};

}  // namespace adapters::binance

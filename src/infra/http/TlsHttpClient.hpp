#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace infra::http {

enum class TransportError {
    None,
    DnsFailure,
    ConnectTimeout,
    ConnectRefused,
    TlsFailure,
    ReadTimeout,
    ConnectionReset,
    ProxyFailure,
    RedirectFailure,
    Other,
};

const char* to_string(TransportError error) noexcept;

struct ProxyConfig {
    std::string host;
    std::string port{"8080"};

    // Accepts "http://host:port", "host:port" or "host". HTTPS proxies are
    // not supported; returns std::nullopt for empty or unusable input.
    static std::optional<ProxyConfig> parse(const std::string& url);
};

struct RequestOptions {
    std::chrono::milliseconds connectTimeout{std::chrono::seconds(10)};
    std::chrono::milliseconds readTimeout{std::chrono::seconds(30)};
    std::vector<std::pair<std::string, std::string>> headers;
    std::optional<ProxyConfig> proxy;
};

struct HttpResponse {
    unsigned status = 0U;
    std::string body;
    std::string retryAfterHeader;
    std::string usedWeightHeader;
    std::string finalHost;
    std::string finalTarget;
    TransportError error = TransportError::None;
    std::string errorMessage;

    bool transportOk() const noexcept { return error == TransportError::None; }
};

// Performs a blocking HTTPS GET on port 443, following up to five redirects.
// Network and TLS failures are reported through HttpResponse::error; the call
// only throws on invalid arguments.
HttpResponse https_get(const std::string& host, const std::string& target, const RequestOptions& options);

}  // namespace infra::http

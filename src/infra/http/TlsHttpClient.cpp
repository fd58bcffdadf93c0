#include "infra/http/TlsHttpClient.hpp"

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

#include "common/Log.hpp"

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr int kMaxRedirects = 5;
constexpr const char* kHttpsPort = "443";

enum class Phase {
    Connect,
    Proxy,
    Handshake,
    Exchange,
};

TransportError classifyIoError(const beast::error_code& ec, Phase phase) {
    if (ec == beast::error::timeout) {
        return (phase == Phase::Connect || phase == Phase::Proxy) ? TransportError::ConnectTimeout
                                                                   : TransportError::ReadTimeout;
    }
    if (ec == net::error::connection_refused || ec == net::error::host_unreachable ||
        ec == net::error::network_unreachable) {
        return phase == Phase::Connect ? TransportError::ConnectRefused : TransportError::ConnectionReset;
    }
    if (ec == net::error::connection_reset || ec == net::error::connection_aborted ||
        ec == net::error::broken_pipe || ec == net::error::eof || ec == bhttp::error::end_of_stream ||
        ec == ssl::error::stream_truncated) {
        return TransportError::ConnectionReset;
    }
    if (phase == Phase::Handshake) {
        return TransportError::TlsFailure;
    }
    if (phase == Phase::Proxy) {
        return TransportError::ProxyFailure;
    }
    return TransportError::Other;
}

HttpResponse makeFailure(const std::string& host,
                         const std::string& target,
                         TransportError error,
                         const std::string& message) {
    HttpResponse response{};
    response.error = error;
    response.finalHost = host;
    response.finalTarget = target;
    std::ostringstream oss;
    oss << "GET https://" << host << target << " failed: " << message;
    response.errorMessage = oss.str();
    return response;
}

struct ParsedLocation {
    std::string host;
    std::string target;
};

std::optional<ParsedLocation> parseRedirectLocation(const std::string& location,
                                                    const std::string& currentHost,
                                                    std::string& reason) {
    if (location.empty()) {
        reason = "redirect without Location header";
        return std::nullopt;
    }

    ParsedLocation result{};
    if (location.rfind("https://", 0) == 0) {
        const std::string withoutScheme = location.substr(std::string{"https://"}.size());
        const auto slashPos = withoutScheme.find('/');
        std::string hostPart = slashPos == std::string::npos ? withoutScheme : withoutScheme.substr(0, slashPos);
        const auto colonPos = hostPart.find(':');
        if (colonPos != std::string::npos) {
            if (hostPart.substr(colonPos + 1) != kHttpsPort) {
                reason = "redirect to unsupported port in " + location;
                return std::nullopt;
            }
            hostPart = hostPart.substr(0, colonPos);
        }
        if (hostPart.empty()) {
            reason = "redirect URL without host";
            return std::nullopt;
        }
        result.host = std::move(hostPart);
        result.target = slashPos == std::string::npos ? std::string{"/"} : withoutScheme.substr(slashPos);
    } else if (location.rfind("http://", 0) == 0) {
        reason = "insecure redirect to " + location;
        return std::nullopt;
    } else {
        result.host = currentHost;
        result.target = location.front() == '/' ? location : "/" + location;
    }
    return result;
}

// Opens a CONNECT tunnel through the proxy on an already connected socket.
beast::error_code openTunnel(beast::tcp_stream& socket,
                             const std::string& host,
                             std::chrono::milliseconds timeout,
                             unsigned& proxyStatus) {
    const std::string authority = host + ":" + kHttpsPort;
    bhttp::request<bhttp::empty_body> connectRequest{bhttp::verb::connect, authority, 11};
    connectRequest.set(bhttp::field::host, authority);
    connectRequest.set("Proxy-Connection", "keep-alive");

    beast::error_code ec;
    socket.expires_after(timeout);
    bhttp::write(socket, connectRequest, ec);
    if (ec) {
        return ec;
    }

    beast::flat_buffer buffer;
    bhttp::response_parser<bhttp::empty_body> parser;
    parser.skip(true);
    bhttp::read(socket, buffer, parser, ec);
    proxyStatus = static_cast<unsigned>(parser.get().result_int());
    return ec;
}

HttpResponse performRequest(const std::string& host, const std::string& target, const RequestOptions& options) {
    net::io_context ioc;
    ssl::context sslContext(ssl::context::tls_client);
    sslContext.set_default_verify_paths();
    sslContext.set_verify_mode(ssl::verify_peer);

    ssl::stream<beast::tcp_stream> stream(ioc, sslContext);
    stream.set_verify_callback(ssl::host_name_verification(host));

    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        return makeFailure(host, target, TransportError::TlsFailure,
                           std::string{"cannot set SNI hostname"} + (reason != nullptr ? std::string{": "} + reason : ""));
    }

    const std::string& dialHost = options.proxy ? options.proxy->host : host;
    const std::string dialPort = options.proxy ? options.proxy->port : std::string{kHttpsPort};

    net::ip::tcp::resolver resolver(ioc);
    beast::error_code ec;
    const auto results = resolver.resolve(dialHost, dialPort, ec);
    if (ec) {
        return makeFailure(host, target,
                           options.proxy ? TransportError::ProxyFailure : TransportError::DnsFailure,
                           "cannot resolve " + dialHost + ": " + ec.message());
    }

    auto& socket = beast::get_lowest_layer(stream);
    socket.expires_after(options.connectTimeout);
    socket.connect(results, ec);
    if (ec) {
        return makeFailure(host, target, classifyIoError(ec, Phase::Connect),
                           "connect to " + dialHost + ":" + dialPort + ": " + ec.message());
    }

    if (options.proxy) {
        unsigned proxyStatus = 0U;
        ec = openTunnel(socket, host, options.connectTimeout, proxyStatus);
        if (ec) {
            return makeFailure(host, target, classifyIoError(ec, Phase::Proxy), "proxy tunnel: " + ec.message());
        }
        if (proxyStatus != 200U) {
            return makeFailure(host, target, TransportError::ProxyFailure,
                               "proxy refused CONNECT with HTTP " + std::to_string(proxyStatus));
        }
    }

    socket.expires_after(options.readTimeout);
    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        return makeFailure(host, target, classifyIoError(ec, Phase::Handshake), "TLS handshake: " + ec.message());
    }

    bhttp::request<bhttp::empty_body> request{bhttp::verb::get, target, 11};
    request.set(bhttp::field::host, host);
    request.set(bhttp::field::user_agent, BOOST_BEAST_VERSION_STRING);
    for (const auto& header : options.headers) {
        request.set(header.first, header.second);
    }
    request.set(bhttp::field::connection, "close");

    socket.expires_after(options.readTimeout);
    bhttp::write(stream, request, ec);
    if (ec) {
        return makeFailure(host, target, classifyIoError(ec, Phase::Exchange), "write: " + ec.message());
    }

    beast::flat_buffer buffer;
    bhttp::response<bhttp::string_body> raw;
    socket.expires_after(options.readTimeout);
    bhttp::read(stream, buffer, raw, ec);
    if (ec) {
        return makeFailure(host, target, classifyIoError(ec, Phase::Exchange), "read: " + ec.message());
    }

    HttpResponse response{};
    response.status = static_cast<unsigned>(raw.result_int());
    response.finalHost = host;
    response.finalTarget = target;
    if (auto it = raw.base().find(bhttp::field::retry_after); it != raw.base().end()) {
        response.retryAfterHeader = std::string{it->value()};
    }
    if (auto it = raw.base().find("X-MBX-USED-WEIGHT-1M"); it != raw.base().end()) {
        response.usedWeightHeader = std::string{it->value()};
    }
    if (response.status >= 300U && response.status < 400U) {
        if (auto it = raw.base().find(bhttp::field::location); it != raw.base().end()) {
            response.body = std::string{it->value()};
        }
    } else {
        response.body = std::move(raw.body());
    }

    // The payload is complete at this point; a rough close is not a failure.
    socket.expires_after(options.readTimeout);
    stream.shutdown(ec);
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
        LOG_DEBUG("TLS shutdown with " << host << " ended with: " << ec.message());
    }

    return response;
}

bool isRedirect(unsigned status) noexcept {
    return status == 301U || status == 302U || status == 307U || status == 308U;
}

}  // namespace

const char* to_string(TransportError error) noexcept {
    switch (error) {
    case TransportError::None:
        return "none";
    case TransportError::DnsFailure:
        return "dns-failure";
    case TransportError::ConnectTimeout:
        return "connect-timeout";
    case TransportError::ConnectRefused:
        return "connect-refused";
    case TransportError::TlsFailure:
        return "tls-failure";
    case TransportError::ReadTimeout:
        return "read-timeout";
    case TransportError::ConnectionReset:
        return "connection-reset";
    case TransportError::ProxyFailure:
        return "proxy-failure";
    case TransportError::RedirectFailure:
        return "redirect-failure";
    case TransportError::Other:
        break;
    }
    return "other";
}

std::optional<ProxyConfig> ProxyConfig::parse(const std::string& url) {
    std::string rest = url;
    while (!rest.empty() && (rest.back() == '/' || rest.back() == ' ')) {
        rest.pop_back();
    }
    if (rest.rfind("http://", 0) == 0) {
        rest = rest.substr(std::string{"http://"}.size());
    } else if (rest.find("://") != std::string::npos) {
        return std::nullopt;
    }
    if (const auto at = rest.rfind('@'); at != std::string::npos) {
        // Credentials are not forwarded.
        rest = rest.substr(at + 1);
    }
    if (rest.empty()) {
        return std::nullopt;
    }

    ProxyConfig config{};
    const auto colon = rest.rfind(':');
    if (colon == std::string::npos) {
        config.host = rest;
        return config;
    }
    config.host = rest.substr(0, colon);
    config.port = rest.substr(colon + 1);
    if (config.host.empty() || config.port.empty() ||
        config.port.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    return config;
}

HttpResponse https_get(const std::string& host, const std::string& target, const RequestOptions& options) {
    if (host.empty()) {
        throw std::invalid_argument("HTTPS GET requires a non-empty host");
    }
    if (options.connectTimeout.count() <= 0 || options.readTimeout.count() <= 0) {
        throw std::invalid_argument("HTTPS GET timeouts must be positive");
    }

    std::string currentHost = host;
    std::string currentTarget = target.empty() ? std::string{"/"} : target;
    if (currentTarget.front() != '/') {
        currentTarget.insert(currentTarget.begin(), '/');
    }

    for (int redirectCount = 0; redirectCount <= kMaxRedirects; ++redirectCount) {
        auto response = performRequest(currentHost, currentTarget, options);
        if (!response.transportOk() || !isRedirect(response.status)) {
            return response;
        }

        std::string reason;
        const auto parsed = parseRedirectLocation(response.body, currentHost, reason);
        if (!parsed) {
            return makeFailure(currentHost, currentTarget, TransportError::RedirectFailure, reason);
        }
        LOG_DEBUG("Following HTTP " << response.status << " from " << currentHost << " to " << parsed->host
                                    << parsed->target);
        currentHost = parsed->host;
        currentTarget = parsed->target;
    }

    return makeFailure(currentHost, currentTarget, TransportError::RedirectFailure, "too many redirects");
}

}  // namespace infra::http

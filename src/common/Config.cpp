#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "domain/exchange/Interval.hpp"

namespace kh::common {
namespace {

constexpr int kMaxSingleDays = 30;

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

long long parseInteger(const std::string& value, const std::string& label, long long min, long long max) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoll(value, &consumed);
        if (consumed != value.size() || parsed < min || parsed > max) {
            throw std::out_of_range("value out of range");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": '" + value + "' (expected " +
                                 std::to_string(min) + ".." + std::to_string(max) + ")");
    }
}

std::uint32_t parseDurationMs(const std::string& value, const std::string& label) {
    return static_cast<std::uint32_t>(
        parseInteger(value, label, 1, std::numeric_limits<std::uint32_t>::max()));
}

std::uint64_t parseSeed(const std::string& value) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoull(value, &consumed);
        if (consumed != value.size() || value.front() == '-') {
            throw std::invalid_argument("trailing characters");
        }
        return static_cast<std::uint64_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for --seed: '" + value + "'");
    }
}

std::string parseSymbol(const std::string& value) {
    auto symbol = toUpper(trim(value));
    if (symbol.empty() || !std::all_of(symbol.begin(), symbol.end(), [](unsigned char ch) {
            return std::isalnum(ch) != 0;
        })) {
        throw std::runtime_error("Invalid symbol: '" + value + "'");
    }
    return symbol;
}

std::string parseInterval(const std::string& value) {
    auto interval = trim(value);
    try {
        domain::interval_from_string(interval);
    } catch (const std::invalid_argument& ex) {
        throw std::runtime_error(ex.what());
    }
    return interval;
}

std::vector<std::string> parseCsvList(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto trimmed = trim(item);
        if (!trimmed.empty()) {
            parts.push_back(std::move(trimmed));
        }
    }
    return parts;
}

// "host" or "host@spot" / "host@futures".
std::vector<domain::Endpoint> parseEndpoints(const std::string& value) {
    std::vector<domain::Endpoint> endpoints;
    for (auto& item : parseCsvList(value)) {
        domain::Endpoint endpoint;
        const auto at = item.find('@');
        endpoint.host = toLower(trim(item.substr(0, at)));
        if (at != std::string::npos) {
            const auto market = toLower(trim(item.substr(at + 1)));
            if (market == "futures") {
                endpoint.market = domain::MarketType::Futures;
            } else if (market != "spot") {
                throw std::runtime_error("Invalid market in --endpoints item '" + item + "'");
            }
        }
        if (endpoint.host.empty() || endpoint.host.find('/') != std::string::npos) {
            throw std::runtime_error("Invalid host in --endpoints item '" + item + "'");
        }
        endpoints.push_back(std::move(endpoint));
    }
    if (endpoints.empty()) {
        throw std::runtime_error("--endpoints requires at least one host");
    }
    return endpoints;
}

std::string valueFromArgs(int argc, char** argv, std::initializer_list<const char*> keys) {
    for (const std::string key : keys) {
        const std::string withEquals = key + '=';
        for (int i = 1; i < argc; ++i) {
            std::string arg{argv[i]};
            if (arg == key) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Missing value for " + key);
                }
                return argv[i + 1];
            }
            if (arg.rfind(withEquals, 0) == 0) {
                return arg.substr(withEquals.size());
            }
        }
    }
    return {};
}

bool hasFlag(int argc, char** argv, std::initializer_list<const char*> keys) {
    for (int i = 1; i < argc; ++i) {
        for (const char* key : keys) {
            if (std::string{key} == argv[i]) {
                return true;
            }
        }
    }
    return false;
}

}  // namespace

const char* to_string(DownloadMode mode) noexcept {
    switch (mode) {
    case DownloadMode::Complete:
        return "complete";
    case DownloadMode::Intraday:
        return "intraday";
    case DownloadMode::Single:
        break;
    }
    return "single";
}

const char* Config::usage() noexcept {
    return "Usage: kh_fetch [-s SYMBOL] [-i INTERVAL] [-d DAYS] [--complete | --intraday] [-v]\n"
           "  -s, --symbol SYMBOL        trading pair, default BTCUSDT\n"
           "  -i, --interval INTERVAL    1m 3m 5m 15m 30m 1h 2h 4h 6h 8h 12h 1d 1w, default 30m\n"
           "  -d, --days DAYS            days back from now (1..30), default 3\n"
           "  --complete, --multi        1w:52 1d:90 4h:30 30m:7 5m:3\n"
           "  --intraday                 4h:30 30m:7 5m:3\n"
           "  -v, --verbose              debug logging\n"
           "  --log-level LEVEL          debug | info | warn | error (env LOG_LEVEL)\n"
           "  --proxy URL                outbound proxy (env KH_PROXY, HTTPS_PROXY)\n"
           "  --connect-timeout-ms MS    default 10000\n"
           "  --read-timeout-ms MS       default 30000\n"
           "  --endpoints LIST           host[@spot|@futures],...\n"
           "  --chunk-hours H            window span, default 6\n"
           "  --window-retries N         failed attempts before a window is skipped, default 3\n"
           "  --max-retries N            failed attempts per fetch before giving up, default 20\n"
           "  --rotate-after N           consecutive failures forcing a rotation, default 5\n"
           "  --seed N                   seed for endpoint rotation and jitter\n"
           "  --output-dir DIR           CSV directory, default .\n"
           "  --no-csv                   fetch only, do not write files\n";
}

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (const char* envLogLevel = std::getenv("LOG_LEVEL")) {
        try {
            config.logLevel = kh::log::levelFromString(toLower(envLogLevel));
        } catch (const std::invalid_argument& ex) {
            throw std::runtime_error(std::string{"LOG_LEVEL: "} + ex.what());
        }
    }
    for (const char* name : {"KH_PROXY", "HTTPS_PROXY", "https_proxy"}) {
        if (const char* envProxy = std::getenv(name)) {
            auto value = trim(envProxy);
            if (!value.empty()) {
                config.proxy = std::move(value);
                break;
            }
        }
    }

    config.help = hasFlag(argc, argv, {"-h", "--help"});

    if (auto symbolArg = valueFromArgs(argc, argv, {"-s", "--symbol"}); !symbolArg.empty()) {
        config.symbol = parseSymbol(symbolArg);
    }
    if (auto intervalArg = valueFromArgs(argc, argv, {"-i", "--interval"}); !intervalArg.empty()) {
        config.interval = parseInterval(intervalArg);
    }
    if (auto daysArg = valueFromArgs(argc, argv, {"-d", "--days"}); !daysArg.empty()) {
        config.days = static_cast<int>(parseInteger(daysArg, "--days", 1, kMaxSingleDays));
    }

    const bool complete = hasFlag(argc, argv, {"--complete", "--multi"});
    const bool intraday = hasFlag(argc, argv, {"--intraday"});
    if (complete && intraday) {
        throw std::runtime_error("--complete and --intraday are mutually exclusive");
    }
    if (complete) {
        config.mode = DownloadMode::Complete;
    } else if (intraday) {
        config.mode = DownloadMode::Intraday;
    }

    if (auto levelArg = valueFromArgs(argc, argv, {"--log-level"}); !levelArg.empty()) {
        try {
            config.logLevel = kh::log::levelFromString(toLower(levelArg));
        } catch (const std::invalid_argument& ex) {
            throw std::runtime_error(std::string{"--log-level: "} + ex.what());
        }
    }
    if (hasFlag(argc, argv, {"-v", "--verbose"})) {
        config.logLevel = kh::log::Level::Debug;
    }

    if (auto proxyArg = valueFromArgs(argc, argv, {"--proxy"}); !proxyArg.empty()) {
        config.proxy = trim(proxyArg);
    }
    if (auto connectArg = valueFromArgs(argc, argv, {"--connect-timeout-ms"}); !connectArg.empty()) {
        config.connectTimeoutMs = parseDurationMs(connectArg, "--connect-timeout-ms");
    }
    if (auto readArg = valueFromArgs(argc, argv, {"--read-timeout-ms"}); !readArg.empty()) {
        config.readTimeoutMs = parseDurationMs(readArg, "--read-timeout-ms");
    }
    if (auto endpointsArg = valueFromArgs(argc, argv, {"--endpoints"}); !endpointsArg.empty()) {
        config.endpoints = parseEndpoints(endpointsArg);
    }

    if (auto chunkArg = valueFromArgs(argc, argv, {"--chunk-hours"}); !chunkArg.empty()) {
        config.chunkHours = static_cast<std::uint32_t>(parseInteger(chunkArg, "--chunk-hours", 1, 24 * 30));
    }
    if (auto windowArg = valueFromArgs(argc, argv, {"--window-retries"}); !windowArg.empty()) {
        config.windowRetries = static_cast<int>(parseInteger(windowArg, "--window-retries", 1, 100));
    }
    if (auto maxArg = valueFromArgs(argc, argv, {"--max-retries"}); !maxArg.empty()) {
        config.maxRetries = static_cast<int>(parseInteger(maxArg, "--max-retries", 1, 10000));
    }
    if (auto rotateArg = valueFromArgs(argc, argv, {"--rotate-after"}); !rotateArg.empty()) {
        config.rotateAfter = static_cast<int>(parseInteger(rotateArg, "--rotate-after", 1, 1000));
    }
    if (auto seedArg = valueFromArgs(argc, argv, {"--seed"}); !seedArg.empty()) {
        config.seed = parseSeed(seedArg);
    }

    if (auto outputArg = valueFromArgs(argc, argv, {"--output-dir"}); !outputArg.empty()) {
        config.outputDir = trim(outputArg);
    }
    if (hasFlag(argc, argv, {"--no-csv"})) {
        config.writeCsv = false;
    }

    return config;
}

}  // namespace kh::common

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>

#include "adapters/binance/BinanceKlinesSource.hpp"
#include "adapters/csv/CandleCsvWriter.hpp"
#include "app/HistoryDownloader.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "core/fetch/Clock.hpp"
#include "core/fetch/FetchPolicy.hpp"
#include "core/fetch/RangeFetcher.hpp"

namespace {

volatile std::sig_atomic_t gSignalStatus = 0;

void handleSignal(int signal) {
    gSignalStatus = signal;
}

core::fetch::FetchPolicy makePolicy(const kh::common::Config& config) {
    core::fetch::FetchPolicy policy;
    policy.chunkSpanMs = static_cast<domain::TimestampMs>(config.chunkHours) * domain::kMillisPerHour;
    policy.rowLimit = adapters::binance::BinanceKlinesSource::kMaxLimit;
    policy.windowRetryBudget = config.windowRetries;
    policy.totalRetryCeiling = config.maxRetries;
    policy.rotateAfterConsecutive = config.rotateAfter;
    return policy;
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        try {
            auto eptr = std::current_exception();
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& ex) {
                    std::fprintf(stderr, "std::terminate: %s\n", ex.what());
                } catch (...) {
                    std::fprintf(stderr, "std::terminate: unknown exception\n");
                }
            } else {
                std::fprintf(stderr, "std::terminate without current_exception\n");
            }
        } catch (...) {
        }
        std::_Exit(1);
    });

    try {
        const auto config = kh::common::Config::fromArgs(argc, argv);
        if (config.help) {
            std::cout << kh::common::Config::usage();
            return EXIT_SUCCESS;
        }
        kh::log::setLevel(config.logLevel);

        const std::uint64_t seed = config.seed.value_or(std::random_device{}());

        adapters::binance::BinanceKlinesSource::Options sourceOptions;
        sourceOptions.connectTimeout = std::chrono::milliseconds(config.connectTimeoutMs);
        sourceOptions.readTimeout = std::chrono::milliseconds(config.readTimeoutMs);
        sourceOptions.seed = seed;
        if (!config.proxy.empty()) {
            sourceOptions.proxy = infra::http::ProxyConfig::parse(config.proxy);
            if (!sourceOptions.proxy) {
                throw std::runtime_error("Unusable proxy address: " + config.proxy);
            }
        }

        auto endpoints = config.endpoints.empty() ? adapters::binance::BinanceKlinesSource::default_endpoints()
                                                  : config.endpoints;

        LOG_INFO("Configuration loaded");
        LOG_INFO("  Symbol: " << config.symbol << ", mode: " << kh::common::to_string(config.mode));
        LOG_INFO("  Log level: " << kh::log::levelToString(config.logLevel));
        LOG_INFO("  Endpoints: " << endpoints.size() << ", first " << endpoints.front().host);
        LOG_INFO("  Proxy: " << (sourceOptions.proxy ? sourceOptions.proxy->host + ":" + sourceOptions.proxy->port
                                                     : std::string{"none"}));
        LOG_INFO("  Timeouts: connect " << config.connectTimeoutMs << " ms, read " << config.readTimeoutMs << " ms");
        LOG_INFO("  Retries: window " << config.windowRetries << ", total " << config.maxRetries
                                      << ", rotate after " << config.rotateAfter);
        LOG_DEBUG("  Seed: " << seed);

        adapters::binance::BinanceKlinesSource source(sourceOptions);
        core::fetch::SystemClock clock;
        core::fetch::RangeFetcher fetcher(source, std::move(endpoints), makePolicy(config), clock, seed);
        fetcher.set_cancel_predicate([] { return gSignalStatus != 0; });

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        std::optional<adapters::csv::CandleCsvWriter> writer;
        if (config.writeCsv) {
            writer.emplace(config.outputDir);
        }

        app::HistoryDownloader downloader(config, fetcher, writer ? &*writer : nullptr);
        const auto result = downloader.run();

        if (result.cancelled) {
            LOG_INFO("Interrupted by signal " << static_cast<int>(gSignalStatus) << ", exiting");
            return EXIT_SUCCESS;
        }
        if (!result.anySeries()) {
            LOG_ERR("No candles could be retrieved for " << config.symbol);
            return EXIT_FAILURE;
        }
        LOG_INFO("Done: " << result.rowsByInterval.size() << " series, " << result.files.size() << " files");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        LOG_ERR("Fatal error: " << ex.what());
        return EXIT_FAILURE;
    }
}

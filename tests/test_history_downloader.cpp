#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "adapters/csv/CandleCsvWriter.hpp"
#include "app/HistoryDownloader.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "core/fetch/Clock.hpp"
#include "core/fetch/RangeFetcher.hpp"
#include "domain/exchange/Interval.hpp"

namespace {

using domain::Candle;
using domain::Endpoint;
using domain::KlinesAttempt;
using domain::KlinesRequest;
using domain::TimestampMs;

constexpr TimestampMs kNow = 1'699'999'200'000;

class FakeClock final : public core::fetch::Clock {
public:
    TimestampMs now_ms() const override { return kNow; }
    void sleep_for(std::chrono::milliseconds) override {}
};

// Serves aligned candles for every interval except `failing`.
class GridSource final : public domain::IKlinesSource {
public:
    explicit GridSource(std::string failing) : failing_(std::move(failing)) {}

    KlinesAttempt fetch_klines(const Endpoint&, const KlinesRequest& request) override {
        ++calls;
        if (request.interval == failing_) {
            domain::FetchError error;
            error.kind = domain::FetchErrorKind::HttpStatus;
            error.httpStatus = 503;
            return KlinesAttempt::failure(std::move(error));
        }
        const auto step = domain::interval_from_string(request.interval).ms;
        std::vector<Candle> rows;
        for (auto open = ((request.startMs + step - 1) / step) * step; open <= request.endMs; open += step) {
            Candle candle;
            candle.openTime = open;
            candle.closeTime = open + step - 1;
            candle.open = 10.0;
            candle.high = 12.5;
            candle.low = 9.75;
            candle.close = 11.0;
            candle.baseVolume = 2.0;
            candle.quoteVolume = 22.0;
            candle.trades = 7;
            rows.push_back(candle);
        }
        return KlinesAttempt::success(std::move(rows));
    }

    int calls = 0;

private:
    std::string failing_;
};

core::fetch::FetchPolicy fastPolicy() {
    core::fetch::FetchPolicy policy;
    policy.jitterMax = std::chrono::milliseconds(0);
    policy.courtesyJitter = std::chrono::milliseconds(0);
    return policy;
}

std::vector<Endpoint> endpoints() {
    return {{"a.example", domain::MarketType::Spot}, {"b.example", domain::MarketType::Spot}};
}

std::vector<std::string> readLines(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

int main() {
    std::ostringstream logSink;
    kh::log::redirect(&logSink);

    const auto dir = std::filesystem::temp_directory_path() / "kh_history_downloader_test";
    std::filesystem::remove_all(dir);

    {
        // Single mode writes one CSV with every candle.
        kh::common::Config config;
        config.symbol = "BTCUSDT";
        config.interval = "1h";
        config.days = 1;

        GridSource source("");
        FakeClock clock;
        core::fetch::RangeFetcher fetcher(source, endpoints(), fastPolicy(), clock, 1);
        adapters::csv::CandleCsvWriter writer(dir);
        app::HistoryDownloader downloader(config, fetcher, &writer);

        const auto result = downloader.run();
        if (result.cancelled || result.files.size() != 1U || result.rowsByInterval.at("1h") != 25U) {
            kh::log::redirect(nullptr);
            std::cerr << "Single mode must write one file with 25 hourly candles\n";
            return 1;
        }
        const auto& file = result.files.front();
        if (file.filename().string().rfind("PA_BTCUSDT_1h_", 0) != 0 || file.extension() != ".csv") {
            kh::log::redirect(nullptr);
            std::cerr << "Unexpected file name " << file.filename() << "\n";
            return 1;
        }
        const auto lines = readLines(file);
        if (lines.size() != 26U || lines.front() != adapters::csv::CandleCsvWriter::kHeader) {
            kh::log::redirect(nullptr);
            std::cerr << "CSV must contain the header and one line per candle\n";
            return 1;
        }
        const auto expectedFirst = std::to_string(kNow - domain::kMillisPerDay) + ",10,12.5,9.75,11,2," +
                                   std::to_string(kNow - domain::kMillisPerDay + domain::kMillisPerHour - 1) +
                                   ",22,7";
        if (lines[1] != expectedFirst) {
            kh::log::redirect(nullptr);
            std::cerr << "Unexpected first CSV row: " << lines[1] << "\n";
            return 1;
        }
    }

    {
        // Intraday preset tolerates a failing interval.
        kh::common::Config config;
        config.mode = kh::common::DownloadMode::Intraday;

        GridSource source("30m");
        FakeClock clock;
        core::fetch::RangeFetcher fetcher(source, endpoints(), fastPolicy(), clock, 2);
        app::HistoryDownloader downloader(config, fetcher, nullptr);

        const auto result = downloader.run();
        if (result.rowsByInterval.size() != 2U || result.rowsByInterval.count("4h") != 1U ||
            result.rowsByInterval.count("5m") != 1U || !result.files.empty()) {
            kh::log::redirect(nullptr);
            std::cerr << "Intraday run must keep 4h and 5m and write nothing without a writer\n";
            return 1;
        }
        if (result.failedIntervals != std::vector<std::string>{"30m"} || !result.anySeries()) {
            kh::log::redirect(nullptr);
            std::cerr << "Failed interval must be reported\n";
            return 1;
        }
    }

    {
        kh::common::Config complete;
        complete.mode = kh::common::DownloadMode::Complete;
        const auto plan = app::HistoryDownloader::plan_for(complete);
        const core::fetch::RangeFetcher::IntervalPlan expected{
            {"1w", 52}, {"1d", 90}, {"4h", 30}, {"30m", 7}, {"5m", 3}};
        if (plan != expected) {
            kh::log::redirect(nullptr);
            std::cerr << "Complete preset does not match\n";
            return 1;
        }
    }

    {
        // Interruption discards partial data.
        kh::common::Config config;
        config.interval = "1h";
        config.days = 1;

        GridSource source("");
        FakeClock clock;
        core::fetch::RangeFetcher fetcher(source, endpoints(), fastPolicy(), clock, 3);
        app::HistoryDownloader downloader(config, fetcher, nullptr);
        fetcher.set_cancel_predicate([&source] { return source.calls >= 2; });

        const auto result = downloader.run();
        if (!result.cancelled || result.anySeries()) {
            kh::log::redirect(nullptr);
            std::cerr << "Cancelled run must report cancellation and keep no series\n";
            return 1;
        }
    }

    {
        const auto stamp = std::chrono::system_clock::from_time_t(0);
        const auto name = adapters::csv::CandleCsvWriter::file_name("ETHUSDT", "5m", stamp);
        if (name.size() != std::string{"PA_ETHUSDT_5m_YYYYmmdd_HHMM.csv"}.size() ||
            name.rfind("PA_ETHUSDT_5m_19", 0) != 0) {
            kh::log::redirect(nullptr);
            std::cerr << "Unexpected file name layout " << name << "\n";
            return 1;
        }
    }

    std::filesystem::remove_all(dir);
    kh::log::redirect(nullptr);
    return 0;
}

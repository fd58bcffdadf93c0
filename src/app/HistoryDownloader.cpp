#include "app/HistoryDownloader.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

#include "common/Log.hpp"

namespace app {
namespace {

const core::fetch::RangeFetcher::IntervalPlan kCompletePlan{
    {"1w", 52}, {"1d", 90}, {"4h", 30}, {"30m", 7}, {"5m", 3}};
const core::fetch::RangeFetcher::IntervalPlan kIntradayPlan{{"4h", 30}, {"30m", 7}, {"5m", 3}};

std::string describeSeries(const domain::CandleSeries& series) {
    std::ostringstream out;
    out << series.size() << " candles";
    if (!series.empty()) {
        auto low = series.front().low;
        auto high = series.front().high;
        for (const auto& candle : series) {
            low = std::min(low, candle.low);
            high = std::max(high, candle.high);
        }
        out << ", open_time " << series.front().openTime << ".." << series.back().openTime << ", last close "
            << std::setprecision(12) << series.back().close << ", range " << low << ".." << high;
    }
    return out.str();
}

}  // namespace

HistoryDownloader::HistoryDownloader(const kh::common::Config& config,
                                     core::fetch::RangeFetcher& fetcher,
                                     const adapters::csv::CandleCsvWriter* writer)
    : symbol_(config.symbol),
      plan_(plan_for(config)),
      multi_(config.mode != kh::common::DownloadMode::Single),
      fetcher_(fetcher),
      writer_(writer) {
    fetcher_.set_progress_callback([](std::size_t rows) { LOG_INFO("Progress: " << rows << " candles"); });
}

core::fetch::RangeFetcher::IntervalPlan HistoryDownloader::plan_for(const kh::common::Config& config) {
    switch (config.mode) {
    case kh::common::DownloadMode::Complete:
        return kCompletePlan;
    case kh::common::DownloadMode::Intraday:
        return kIntradayPlan;
    case kh::common::DownloadMode::Single:
        break;
    }
    return {{config.interval, config.days}};
}

void HistoryDownloader::store(const std::string& interval, const domain::CandleSeries& series, Result& result) const {
    LOG_INFO(symbol_ << " " << interval << ": " << describeSeries(series));
    result.rowsByInterval[interval] = series.size();
    if (writer_ != nullptr) {
        result.files.push_back(writer_->write(series, symbol_, interval));
    }
}

HistoryDownloader::Result HistoryDownloader::run() {
    Result result;

    std::ostringstream planText;
    for (const auto& [interval, days] : plan_) {
        planText << ' ' << interval << ':' << days << 'd';
    }
    LOG_INFO("Downloading " << symbol_ << " (" << (multi_ ? "multi" : "single") << ":" << planText.str() << ")");

    try {
        if (!multi_) {
            const auto& [interval, days] = plan_.front();
            try {
                store(interval, fetcher_.fetch_range(symbol_, interval, days), result);
            } catch (const core::fetch::FetchFailed& ex) {
                LOG_ERR(ex.what());
                result.failedIntervals.push_back(interval);
            }
        } else {
            const auto series = fetcher_.fetch_multiple(symbol_, plan_);
            for (const auto& entry : plan_) {
                const auto it = series.find(entry.first);
                if (it == series.end()) {
                    result.failedIntervals.push_back(entry.first);
                    continue;
                }
                store(entry.first, it->second, result);
            }
        }
    } catch (const core::fetch::FetchCancelled& ex) {
        LOG_WARN("Download interrupted, discarding " << ex.partial().size() << " partial candles");
        result.cancelled = true;
    }

    if (!result.failedIntervals.empty()) {
        std::ostringstream failed;
        for (const auto& interval : result.failedIntervals) {
            failed << ' ' << interval;
        }
        LOG_WARN("No data for:" << failed.str());
    }
    return result;
}

}  // namespace app

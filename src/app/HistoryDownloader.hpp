#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "adapters/csv/CandleCsvWriter.hpp"
#include "common/Config.hpp"
#include "core/fetch/RangeFetcher.hpp"

namespace app {

// Runs the download plan selected on the command line: one interval, or one
// of the multi-interval presets, and writes every retrieved series.
class HistoryDownloader {
public:
    struct Result {
        std::map<std::string, std::size_t> rowsByInterval;
        std::vector<std::filesystem::path> files;
        std::vector<std::string> failedIntervals;
        bool cancelled = false;

        bool anySeries() const noexcept { return !rowsByInterval.empty(); }
    };

    // `writer` may be null to fetch without writing files.
    HistoryDownloader(const kh::common::Config& config,
                      core::fetch::RangeFetcher& fetcher,
                      const adapters::csv::CandleCsvWriter* writer);

    static core::fetch::RangeFetcher::IntervalPlan plan_for(const kh::common::Config& config);

    // Fetch failures are logged and reported in the result; errors writing a
    // file propagate.
    Result run();

private:
    void store(const std::string& interval, const domain::CandleSeries& series, Result& result) const;

    std::string symbol_;
    core::fetch::RangeFetcher::IntervalPlan plan_;
    bool multi_;
    core::fetch::RangeFetcher& fetcher_;
    const adapters::csv::CandleCsvWriter* writer_;
};

}  // namespace app

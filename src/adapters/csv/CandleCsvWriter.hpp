#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "domain/Types.h"

namespace adapters::csv {

// Writes one candle series per file as
// PA_{symbol}_{interval}_{YYYYmmdd_HHMM}.csv (local time of `stamp`).
class CandleCsvWriter {
public:
    explicit CandleCsvWriter(std::filesystem::path directory);

    static constexpr const char* kHeader =
        "open_time,open,high,low,close,volume,close_time,quote_volume,trades";

    static std::string file_name(const std::string& symbol,
                                 const std::string& interval,
                                 std::chrono::system_clock::time_point stamp);

    // Creates the directory when missing and replaces any existing file of the
    // same name. Throws std::runtime_error on I/O failure.
    std::filesystem::path write(const domain::CandleSeries& series,
                                const std::string& symbol,
                                const std::string& interval,
                                std::chrono::system_clock::time_point stamp = std::chrono::system_clock::now()) const;

    const std::filesystem::path& directory() const noexcept { return directory_; }

private:
    std::filesystem::path directory_;
};

}  // namespace adapters::csv

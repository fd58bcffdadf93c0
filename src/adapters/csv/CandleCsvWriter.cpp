#include "adapters/csv/CandleCsvWriter.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "common/Log.hpp"

namespace adapters::csv {
namespace {

std::tm local_tm(std::time_t seconds) {
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &seconds);
#else
    localtime_r(&seconds, &tm);
#endif
    return tm;
}

}  // namespace

CandleCsvWriter::CandleCsvWriter(std::filesystem::path directory) : directory_(std::move(directory)) {
    if (directory_.empty()) {
        directory_ = ".";
    }
}

std::string CandleCsvWriter::file_name(const std::string& symbol,
                                       const std::string& interval,
                                       std::chrono::system_clock::time_point stamp) {
    const auto tm = local_tm(std::chrono::system_clock::to_time_t(stamp));
    std::ostringstream name;
    name << "PA_" << symbol << '_' << interval << '_' << std::put_time(&tm, "%Y%m%d_%H%M") << ".csv";
    return name.str();
}

std::filesystem::path CandleCsvWriter::write(const domain::CandleSeries& series,
                                             const std::string& symbol,
                                             const std::string& interval,
                                             std::chrono::system_clock::time_point stamp) const {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create output directory " + directory_.string() + ": " + ec.message());
    }

    const auto target = directory_ / file_name(symbol, interval, stamp);
    auto partial = target;
    partial += ".part";

    {
        std::ofstream out(partial, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot open " + partial.string() + " for writing");
        }
        out.imbue(std::locale::classic());
        out << std::setprecision(12);
        out << kHeader << '\n';
        for (const auto& candle : series) {
            out << candle.openTime << ',' << candle.open << ',' << candle.high << ',' << candle.low << ','
                << candle.close << ',' << candle.baseVolume << ',' << candle.closeTime << ','
                << candle.quoteVolume << ',' << candle.trades << '\n';
        }
        out.flush();
        if (!out) {
            throw std::runtime_error("Failed writing " + partial.string());
        }
    }

    std::filesystem::rename(partial, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(partial, ignored);
        throw std::runtime_error("Cannot move " + partial.string() + " to " + target.string() + ": " + ec.message());
    }

    LOG_INFO("Wrote " << series.size() << " candles to " << target.string());
    return target;
}

}  // namespace adapters::csv

#include "adapters/binance/KlineParser.hpp"

#include <cmath>
#include <cstdint>
#include <exception>
#include <string>

#include <boost/json.hpp>

namespace adapters::binance {
namespace {

constexpr std::size_t kMinColumns = 7;

std::int64_t json_to_int64(const boost::json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        return static_cast<std::int64_t>(std::llround(value.as_double()));
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stoll(str);
        } catch (const std::exception& ex) {
            throw KlineParseError("Failed to parse integer value: " + str + ", error: " + ex.what());
        }
    }
    throw KlineParseError("Unsupported JSON type for integer conversion");
}

double json_to_double(const boost::json::value& value) {
    if (value.is_double()) {
        return value.as_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            const double parsed = std::stod(str);
            if (!std::isfinite(parsed)) {
                throw KlineParseError("Non-finite decimal value: " + str);
            }
            return parsed;
        } catch (const KlineParseError&) {
            throw;
        } catch (const std::exception& ex) {
            throw KlineParseError("Failed to parse decimal value: " + str + ", error: " + ex.what());
        }
    }
    throw KlineParseError("Unsupported JSON type for decimal conversion");
}

domain::Candle decode_row(const boost::json::array& row, std::size_t index) {
    if (row.size() < kMinColumns) {
        throw KlineParseError("Kline row " + std::to_string(index) + " has " + std::to_string(row.size()) +
                              " columns, expected at least " + std::to_string(kMinColumns));
    }

    domain::Candle candle{};
    candle.openTime = json_to_int64(row.at(0));
    candle.open = json_to_double(row.at(1));
    candle.high = json_to_double(row.at(2));
    candle.low = json_to_double(row.at(3));
    candle.close = json_to_double(row.at(4));
    candle.baseVolume = json_to_double(row.at(5));
    candle.closeTime = json_to_int64(row.at(6));
    if (row.size() > 7) {
        candle.quoteVolume = json_to_double(row.at(7));
    }
    if (row.size() > 8) {
        candle.trades = static_cast<domain::TradeCount>(json_to_int64(row.at(8)));
    }

    if (candle.openTime <= 0 || candle.closeTime < candle.openTime) {
        throw KlineParseError("Kline row " + std::to_string(index) + " has inconsistent open/close times");
    }
    return candle;
}

}  // namespace

std::vector<domain::Candle> parse_klines(const std::string& body) {
    boost::json::error_code ec;
    const boost::json::value json = boost::json::parse(body, ec);
    if (ec) {
        throw KlineParseError("Klines body is not valid JSON: " + ec.message());
    }

    if (!json.is_array()) {
        std::string detail;
        if (json.is_object()) {
            // The provider reports request errors as {"code": ..., "msg": ...}.
            if (const auto* msg = json.as_object().if_contains("msg"); msg != nullptr && msg->is_string()) {
                detail = std::string{": "} + msg->as_string().c_str();
            }
        }
        throw KlineParseError("Unexpected klines body (expected array)" + detail);
    }

    const auto& outer = json.as_array();
    std::vector<domain::Candle> rows;
    rows.reserve(outer.size());
    for (std::size_t i = 0; i < outer.size(); ++i) {
        const auto& rowValue = outer[i];
        if (!rowValue.is_array()) {
            throw KlineParseError("Kline row " + std::to_string(i) + " is not an array");
        }
        rows.push_back(decode_row(rowValue.as_array(), i));
    }
    return rows;
}

}  // namespace adapters::binance

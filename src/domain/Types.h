#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace domain {

using TimestampMs = long long;
using TradeCount = std::int32_t;
using Symbol = std::string;

constexpr TimestampMs kMillisPerSecond = 1'000;
constexpr TimestampMs kMillisPerMinute = 60 * kMillisPerSecond;
constexpr TimestampMs kMillisPerHour = 60 * kMillisPerMinute;
constexpr TimestampMs kMillisPerDay = 24 * kMillisPerHour;

struct Interval {
    TimestampMs ms{0};
    constexpr bool valid() const noexcept { return ms > 0; }
};

// Half-open [start, end).
struct TimeWindow {
    TimestampMs start{0};
    TimestampMs end{0};
    constexpr bool empty() const noexcept { return end <= start; }
    constexpr TimestampMs span() const noexcept { return end - start; }
};

inline bool operator==(const TimeWindow& lhs, const TimeWindow& rhs) noexcept {
    return lhs.start == rhs.start && lhs.end == rhs.end;
}

struct Candle {
    TimestampMs openTime{0};
    TimestampMs closeTime{0};
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    double baseVolume{0};
    double quoteVolume{0};
    TradeCount trades{0};
};

using CandleSeries = std::vector<Candle>;

enum class MarketType {
    Spot,
    Futures,
};

inline const char* to_string(MarketType market) noexcept {
    return market == MarketType::Futures ? "futures" : "spot";
}

struct Endpoint {
    std::string host;
    MarketType market{MarketType::Spot};
};

inline bool operator==(const Endpoint& lhs, const Endpoint& rhs) noexcept {
    return lhs.host == rhs.host && lhs.market == rhs.market;
}

}  // namespace domain

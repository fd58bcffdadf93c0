#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "domain/Types.h"

namespace adapters::binance {

class KlineParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Decodes a klines body: a JSON array of rows laid out as
// [openTime, open, high, low, close, volume, closeTime, quoteVolume, trades, ...].
// Prices may arrive as strings or numbers. Columns past index 8 are ignored.
// Throws KlineParseError when the body or any row does not match that shape.
std::vector<domain::Candle> parse_klines(const std::string& body);

}  // namespace adapters::binance

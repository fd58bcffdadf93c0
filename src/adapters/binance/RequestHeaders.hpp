#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace adapters::binance {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Produces browser-like header sets, drawing a different user agent and
// language preference for each attempt.
class RequestHeaders {
public:
    explicit RequestHeaders(std::uint64_t seed);

    HeaderList next();

    static const std::vector<std::string>& user_agents();

private:
    std::mt19937_64 rng_;
};

}  // namespace adapters::binance

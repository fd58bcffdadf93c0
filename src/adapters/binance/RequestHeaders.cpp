#include "adapters/binance/RequestHeaders.hpp"

#include <array>

namespace adapters::binance {
namespace {

constexpr std::array<const char*, 4> kLanguages{
    "en-US,en;q=0.9",
    "en-GB,en;q=0.8",
    "en-US,en;q=0.7,de;q=0.3",
    "en;q=0.9,cs;q=0.5",
};

}  // namespace

RequestHeaders::RequestHeaders(std::uint64_t seed) : rng_(seed) {}

const std::vector<std::string>& RequestHeaders::user_agents() {
    static const std::vector<std::string> kAgents{
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/124.0.0.0 Safari/537.36",
        "Mozilla/5.0 (Macintosh; Intel Mac OS X 14_4) AppleWebKit/605.1.15 (KHTML, like Gecko) "
        "Version/17.4 Safari/605.1.15",
        "Mozilla/5.0 (X11; Linux x86_64; rv:125.0) Gecko/20100101 Firefox/125.0",
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:125.0) Gecko/20100101 Firefox/125.0",
        "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/123.0.0.0 Safari/537.36",
    };
    return kAgents;
}

HeaderList RequestHeaders::next() {
    const auto& agents = user_agents();
    std::uniform_int_distribution<std::size_t> agentPick(0, agents.size() - 1);
    std::uniform_int_distribution<std::size_t> languagePick(0, kLanguages.size() - 1);

    HeaderList headers;
    headers.emplace_back("User-Agent", agents[agentPick(rng_)]);
    headers.emplace_back("Accept", "application/json, text/plain, */*");
    headers.emplace_back("Accept-Language", kLanguages[languagePick(rng_)]);
    headers.emplace_back("Cache-Control", "no-cache");
    headers.emplace_back("Pragma", "no-cache");
    return headers;
}

}  // namespace adapters::binance

#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/Log.hpp"
#include "core/fetch/EndpointPool.hpp"

using core::fetch::EndpointPool;
using domain::Endpoint;
using domain::MarketType;

namespace {

std::vector<Endpoint> sample() {
    return {{"api.binance.com", MarketType::Spot},
            {"api1.binance.com", MarketType::Spot},
            {"api2.binance.com", MarketType::Spot},
            {"data-api.binance.vision", MarketType::Spot},
            {"fapi.binance.com", MarketType::Futures}};
}

}  // namespace

int main() {
    std::ostringstream logSink;
    kh::log::redirect(&logSink);

    {
        EndpointPool pool(sample(), 42);
        if (pool.current().host != "api.binance.com" || pool.tried_count() != 1U) {
            kh::log::redirect(nullptr);
            std::cerr << "Initial endpoint must be the first one and count as tried\n";
            return 1;
        }

        // The first cycle visits each remaining endpoint exactly once.
        std::set<std::string> seen{pool.current().host};
        for (std::size_t i = 1; i < pool.size(); ++i) {
            const auto& next = pool.rotate();
            if (!seen.insert(next.host).second) {
                kh::log::redirect(nullptr);
                std::cerr << "Endpoint " << next.host << " repeated before the cycle was exhausted\n";
                return 1;
            }
        }
        if (seen.size() != pool.size() || pool.completed_cycles() != 0U) {
            kh::log::redirect(nullptr);
            std::cerr << "First cycle should cover every endpoint\n";
            return 1;
        }

        // Exhaustion resets the cycle without reselecting the endpoint just abandoned.
        const auto abandoned = pool.current().host;
        const auto& afterReset = pool.rotate();
        if (afterReset.host == abandoned || pool.completed_cycles() != 1U || pool.tried_count() != 1U) {
            kh::log::redirect(nullptr);
            std::cerr << "Reset must start a new cycle and avoid " << abandoned << "\n";
            return 1;
        }

        std::set<std::string> secondCycle{afterReset.host};
        for (std::size_t i = 1; i < pool.size() - 1; ++i) {
            if (!secondCycle.insert(pool.rotate().host).second) {
                kh::log::redirect(nullptr);
                std::cerr << "Endpoint repeated within the second cycle\n";
                return 1;
            }
        }
    }

    {
        EndpointPool first(sample(), 7);
        EndpointPool second(sample(), 7);
        for (int i = 0; i < 12; ++i) {
            if (first.rotate().host != second.rotate().host) {
                kh::log::redirect(nullptr);
                std::cerr << "Same seed must reproduce the rotation order\n";
                return 1;
            }
        }
    }

    {
        logSink.str("");
        EndpointPool pool({{"a.example", MarketType::Spot}, {"f.example", MarketType::Futures}}, 1);
        pool.rotate();
        if (logSink.str().find("f.example") == std::string::npos ||
            logSink.str().find("market=futures") == std::string::npos) {
            kh::log::redirect(nullptr);
            std::cerr << "Rotation must log the new endpoint and its market type: " << logSink.str() << "\n";
            return 1;
        }
    }

    {
        EndpointPool single({{"only.example", MarketType::Spot}}, 3);
        if (single.rotate().host != "only.example" || single.rotate().host != "only.example") {
            kh::log::redirect(nullptr);
            std::cerr << "A single endpoint pool must keep returning its endpoint\n";
            return 1;
        }

        EndpointPool deduplicated({{"a.example", MarketType::Spot},
                                   {"a.example", MarketType::Spot},
                                   {"", MarketType::Spot},
                                   {"a.example", MarketType::Futures}},
                                  3);
        if (deduplicated.size() != 2U) {
            kh::log::redirect(nullptr);
            std::cerr << "Duplicates and empty hosts must be dropped, size=" << deduplicated.size() << "\n";
            return 1;
        }
    }

    try {
        EndpointPool empty({}, 1);
        kh::log::redirect(nullptr);
        std::cerr << "Empty pool must be rejected\n";
        return 1;
    } catch (const std::invalid_argument&) {
    }

    kh::log::redirect(nullptr);
    return 0;
}

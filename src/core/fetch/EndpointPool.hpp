#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

#include "domain/Types.h"

namespace core::fetch {

// Candidate provider endpoints with a per-cycle "tried" set. rotate() draws
// uniformly among endpoints not tried in the current cycle, so every endpoint
// is used once before any repeats; when the cycle is exhausted it starts a new
// one, avoiding the endpoint that was just abandoned when there is a choice.
class EndpointPool {
public:
    // Duplicates are dropped. Throws std::invalid_argument when empty.
    EndpointPool(std::vector<domain::Endpoint> endpoints, std::uint64_t seed);

    const domain::Endpoint& current() const noexcept { return endpoints_[current_]; }
    const domain::Endpoint& rotate();

    std::size_t size() const noexcept { return endpoints_.size(); }
    std::size_t tried_count() const noexcept;
    std::size_t completed_cycles() const noexcept { return cycles_; }
    const std::vector<domain::Endpoint>& endpoints() const noexcept { return endpoints_; }

private:
    std::vector<domain::Endpoint> endpoints_;
    std::vector<bool> tried_;
    std::size_t current_ = 0;
    std::size_t cycles_ = 0;
    std::mt19937_64 rng_;
};

}  // namespace core::fetch

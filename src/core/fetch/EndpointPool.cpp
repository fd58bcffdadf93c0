#include "core/fetch/EndpointPool.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "common/Log.hpp"

namespace core::fetch {

EndpointPool::EndpointPool(std::vector<domain::Endpoint> endpoints, std::uint64_t seed) : rng_(seed) {
    for (auto& endpoint : endpoints) {
        if (endpoint.host.empty()) {
            continue;
        }
        if (std::find(endpoints_.begin(), endpoints_.end(), endpoint) == endpoints_.end()) {
            endpoints_.push_back(std::move(endpoint));
        }
    }
    if (endpoints_.empty()) {
        throw std::invalid_argument("EndpointPool requires at least one endpoint");
    }

    tried_.assign(endpoints_.size(), false);
    tried_[current_] = true;
}

std::size_t EndpointPool::tried_count() const noexcept {
    return static_cast<std::size_t>(std::count(tried_.begin(), tried_.end(), true));
}

const domain::Endpoint& EndpointPool::rotate() {
    std::vector<std::size_t> candidates;
    candidates.reserve(endpoints_.size());
    for (std::size_t i = 0; i < endpoints_.size(); ++i) {
        if (!tried_[i]) {
            candidates.push_back(i);
        }
    }

    if (candidates.empty()) {
        std::fill(tried_.begin(), tried_.end(), false);
        ++cycles_;
        for (std::size_t i = 0; i < endpoints_.size(); ++i) {
            if (i != current_ || endpoints_.size() == 1) {
                candidates.push_back(i);
            }
        }
        LOG_INFO("Endpoint pool exhausted, starting rotation cycle " << cycles_ + 1);
    }

    std::uniform_int_distribution<std::size_t> pick(0, candidates.size() - 1);
    const auto previous = current_;
    current_ = candidates[pick(rng_)];
    tried_[current_] = true;

    const auto& selected = endpoints_[current_];
    LOG_INFO("Rotating endpoint " << endpoints_[previous].host << " -> " << selected.host
                                  << " (market=" << domain::to_string(selected.market) << ", tried "
                                  << tried_count() << "/" << endpoints_.size() << ")");
    return selected;
}

}  // namespace core::fetch

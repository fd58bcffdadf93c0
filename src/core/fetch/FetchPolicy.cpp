#include "core/fetch/FetchPolicy.hpp"

#include <stdexcept>
#include <string>

namespace core::fetch {
namespace {

void require(bool condition, const char* field, const std::string& detail) {
    if (!condition) {
        throw std::invalid_argument(std::string{"FetchPolicy."} + field + " " + detail);
    }
}

}  // namespace

void FetchPolicy::validate() const {
    require(chunkSpanMs > 0, "chunkSpanMs", "must be positive");
    require(rowLimit > 0, "rowLimit", "must be positive");
    require(windowRetryBudget >= 1, "windowRetryBudget", "must be at least 1");
    require(totalRetryCeiling >= 1, "totalRetryCeiling", "must be at least 1");
    require(rotateAfterConsecutive >= 1, "rotateAfterConsecutive", "must be at least 1");
    require(backoffMin.count() >= 0, "backoffMin", "must not be negative");
    require(backoffMax >= backoffMin, "backoffMax", "must not be below backoffMin");
    require(jitterMax.count() >= 0 && courtesyJitter.count() >= 0, "jitterMax", "must not be negative");
    require(rotationSettle.count() >= 0 && courtesyDelay.count() >= 0 && intervalPause.count() >= 0,
            "delays", "must not be negative");
}

}  // namespace core::fetch

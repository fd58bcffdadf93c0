#include "core/fetch/Clock.hpp"

#include <thread>

namespace core::fetch {

domain::TimestampMs SystemClock::now_ms() const {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

void SystemClock::sleep_for(std::chrono::milliseconds duration) {
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}

}  // namespace core::fetch

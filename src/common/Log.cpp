#include "common/Log.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace kh::log {
namespace {

std::atomic<Level> g_level{Level::Info};
std::atomic<std::ostream*> g_sink{nullptr};
std::mutex g_outputMutex;

constexpr std::array<const char*, 4> kLevelLabels{"DEBUG", "INFO", "WARN", "ERROR"};

std::ostream& streamFor(Level level) {
    if (auto* sink = g_sink.load(std::memory_order_acquire)) {
        return *sink;
    }
    if (level == Level::Warn || level == Level::Error) {
        return std::cerr;
    }
    return std::cout;
}

// Downloads are keyed by epoch milliseconds, so log lines use UTC as well.
std::string utcStamp(std::chrono::system_clock::time_point now) {
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &seconds);
#else
    gmtime_r(&seconds, &tm);
#endif

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis
        << 'Z';
    return out.str();
}

}  // namespace

void setLevel(Level level) noexcept { g_level.store(level, std::memory_order_relaxed); }

Level getLevel() noexcept { return g_level.load(std::memory_order_relaxed); }

bool shouldLog(Level level) noexcept {
    return static_cast<int>(level) >= static_cast<int>(getLevel());
}

void redirect(std::ostream* sink) noexcept { g_sink.store(sink, std::memory_order_release); }

void log(Level level, const std::string& message) {
    const auto stamp = utcStamp(std::chrono::system_clock::now());

    std::ostringstream line;
    line << stamp << ' ' << std::left << std::setw(5) << levelToString(level) << " [tid "
         << std::this_thread::get_id() << "] " << message << '\n';

    std::lock_guard<std::mutex> lock(g_outputMutex);
    auto& out = streamFor(level);
    out << line.str();
    if (level >= Level::Warn) {
        out.flush();
    }
}

const char* levelToString(Level level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    if (index < kLevelLabels.size()) {
        return kLevelLabels[index];
    }
    return "INFO";
}

Level levelFromString(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (const char ch : text) {
        if (std::isspace(static_cast<unsigned char>(ch)) == 0) {
            lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
    }

    if (lower == "debug" || lower == "trace") {
        return Level::Debug;
    }
    if (lower == "info") {
        return Level::Info;
    }
    if (lower == "warn" || lower == "warning") {
        return Level::Warn;
    }
    if (lower == "err" || lower == "error") {
        return Level::Error;
    }

    throw std::invalid_argument("Unknown log level: " + std::string{text});
}

}  // namespace kh::log

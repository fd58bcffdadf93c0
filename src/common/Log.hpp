#pragma once

#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace kh::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

// Routes every level to `sink` instead of stdout/stderr. Passing nullptr
// restores the console streams. The sink must outlive its registration.
void redirect(std::ostream* sink) noexcept;

}  // namespace kh::log

#define KH_LOG_IMPL(level, expr)                                                           \
    do {                                                                                   \
        if (::kh::log::shouldLog(level)) {                                                 \
            std::ostringstream kh_log_stream__;                                            \
            kh_log_stream__ << expr;                                                       \
            ::kh::log::log(level, kh_log_stream__.str());                                  \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) KH_LOG_IMPL(::kh::log::Level::Debug, expr)
#define LOG_INFO(expr) KH_LOG_IMPL(::kh::log::Level::Info, expr)
#define LOG_WARN(expr) KH_LOG_IMPL(::kh::log::Level::Warn, expr)
#define LOG_ERR(expr) KH_LOG_IMPL(::kh::log::Level::Error, expr)

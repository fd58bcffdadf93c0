#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/Log.hpp"
#include "domain/Types.h"

namespace kh::common {

enum class DownloadMode {
    Single,
    Complete,
    Intraday,
};

const char* to_string(DownloadMode mode) noexcept;

struct Config {
    std::string symbol = "BTCUSDT";
    std::string interval = "30m";
    int days = 3;
    DownloadMode mode = DownloadMode::Single;

    kh::log::Level logLevel = kh::log::Level::Info;
    bool help = false;

    std::string proxy;
    std::uint32_t connectTimeoutMs = 10000;
    std::uint32_t readTimeoutMs = 30000;
    // Empty means the provider's default host list.
    std::vector<domain::Endpoint> endpoints{};

    std::uint32_t chunkHours = 6;
    int windowRetries = 3;
    int maxRetries = 20;
    int rotateAfter = 5;
    std::optional<std::uint64_t> seed{};

    std::string outputDir = ".";
    bool writeCsv = true;

    static Config fromArgs(int argc, char** argv);
    static const char* usage() noexcept;
};

}  // namespace kh::common

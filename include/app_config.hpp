#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

constexpr const char* DEFAULT_API_URL = "https://mein.green-planet-energy.de/p2";

enum class SourceType : uint8_t {
    GREENPLANET = 0,
    FILE = 1
};

struct SourceConfig {
    SourceType type = SourceType::GREENPLANET;
    std::string url = DEFAULT_API_URL;
    uint32_t timeout_ms = 30000;
    int max_retries = 3;
    std::string snapshot_path;
};

struct AppConfig {
    SourceConfig source;
    std::vector<double> durations{1.0, 2.0, 3.0};

    // Empty path means defaults. Unreadable or invalid files are reported on
    // stderr and also fall back to defaults.
    static AppConfig load(const std::string& config_path);
};

// Command-line values. Whole text must parse; nullopt otherwise.
std::optional<int> parseHourArgument(const std::string& text);
std::optional<double> parseDurationArgument(const std::string& text);

inline const char* sourceTypeName(SourceType type) {
    switch (type) {
        case SourceType::GREENPLANET: return "greenplanet";
        case SourceType::FILE: return "file";
        default: return "unknown";
    }
}

#include "app_config.hpp"
#include "debug_log.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace {

SourceType parseSourceType(const std::string& name) {
    if (name == "greenplanet") return SourceType::GREENPLANET;
    if (name == "file") return SourceType::FILE;
    throw std::runtime_error("Unknown source type '" + name + "'");
}

void readSource(const json& node, SourceConfig& source) {
    source.type = parseSourceType(node.value("type", std::string("greenplanet")));
    source.url = node.value("url", std::string(DEFAULT_API_URL));
    source.snapshot_path = node.value("snapshot_path", std::string());

    const int64_t timeout_ms = node.value("timeout_ms", int64_t{30000});
    if (timeout_ms <= 0 || timeout_ms > std::numeric_limits<uint32_t>::max()) {
        throw std::runtime_error("source.timeout_ms out of range");
    }
    source.timeout_ms = static_cast<uint32_t>(timeout_ms);

    source.max_retries = node.value("max_retries", 3);
    if (source.max_retries < 1) {
        throw std::runtime_error("source.max_retries must be at least 1");
    }

    if (source.type == SourceType::FILE && source.snapshot_path.empty()) {
        throw std::runtime_error("File source needs 'snapshot_path'");
    }
}

}  // namespace

AppConfig AppConfig::load(const std::string& config_path) {
    if (config_path.empty()) {
        return AppConfig{};
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        WARN_LOG("Could not open config file: " << config_path);
        std::cerr << "Using default configuration\n";
        return AppConfig{};
    }

    try {
        json root;
        file >> root;

        AppConfig config;
        if (root.contains("source")) {
            readSource(root["source"], config.source);
        }

        if (root.contains("queries") && root["queries"].contains("durations")) {
            config.durations.clear();
            for (const auto& value : root["queries"]["durations"]) {
                double duration = value.get<double>();
                if (!std::isfinite(duration) || duration <= 0.0) {
                    throw std::runtime_error("Durations must be positive");
                }
                config.durations.push_back(duration);
            }
        }

        DEBUG_LOG("Config: source=" << sourceTypeName(config.source.type)
                 << " durations=" << config.durations.size());
        return config;

    } catch (const std::exception& e) {
        WARN_LOG("Could not parse config: " << e.what());
        std::cerr << "Using default configuration\n";
        return AppConfig{};
    }
}

std::optional<int> parseHourArgument(const std::string& text) {
    try {
        size_t consumed = 0;
        int hour = std::stoi(text, &consumed);
        if (consumed != text.size() || hour < 0 || hour >= 24) {
            return std::nullopt;
        }
        return hour;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<double> parseDurationArgument(const std::string& text) {
    try {
        size_t consumed = 0;
        double duration = std::stod(text, &consumed);
        if (consumed != text.size() || !std::isfinite(duration) || duration <= 0.0) {
            return std::nullopt;
        }
        return duration;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

#pragma once

#include "app_config.hpp"
#include "price_source.hpp"
#include <memory>
#include <string>

class PriceSourceFactory {
public:
    static std::unique_ptr<IPriceSource> createGreenPlanet(const SourceConfig& config);
    static std::unique_ptr<IPriceSource> createFile(const std::string& path);

    // Configuration-driven creation
    static std::unique_ptr<IPriceSource> createFromConfig(const SourceConfig& config);
};

#include "price_source_factory.hpp"
#include "sources/file_source.hpp"
#include "sources/greenplanet_source.hpp"
#include <stdexcept>

std::unique_ptr<IPriceSource> PriceSourceFactory::createGreenPlanet(
    const SourceConfig& config) {
    return std::make_unique<GreenPlanetSource>(config);
}

std::unique_ptr<IPriceSource> PriceSourceFactory::createFile(const std::string& path) {
    return std::make_unique<FileSource>(path);
}

std::unique_ptr<IPriceSource> PriceSourceFactory::createFromConfig(
    const SourceConfig& config) {

    switch (config.type) {
        case SourceType::FILE:
            if (config.snapshot_path.empty()) {
                throw std::invalid_argument("File source needs a snapshot path");
            }
            return createFile(config.snapshot_path);
        case SourceType::GREENPLANET:
            return createGreenPlanet(config);
    }

    throw std::invalid_argument("Unknown source type");
}

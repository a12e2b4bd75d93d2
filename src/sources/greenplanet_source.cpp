#include "sources/greenplanet_source.hpp"
#include "debug_log.hpp"
#include "errors.hpp"
#include "response_parser.hpp"
#include "snapshot.hpp"
#include <nlohmann/json.hpp>
#include <ctime>
#include <utility>

using json = nlohmann::json;

GreenPlanetSource::GreenPlanetSource(SourceConfig config)
    : config_(std::move(config)) {}

GreenPlanetSource::~GreenPlanetSource() {
    close();
}

void GreenPlanetSource::open() {
    if (!session_) {
        session_ = HTTPClientPool::instance().acquire();
    }
}

void GreenPlanetSource::close() {
    if (session_) {
        HTTPClientPool::instance().release(std::move(session_));
    }
}

std::vector<std::string> GreenPlanetSource::requestHeaders() {
    return {
        "Content-Type: application/json",
        "Accept: application/json",
        "X-Requested-With: XMLHttpRequest",
        "Referer: https://mein.green-planet-energy.de/dynamischer-tarif/strompreise"
    };
}

PriceSeries GreenPlanetSource::fetchSnapshot() {
    if (!session_) {
        throw PriceConnectionError("Session not initialized");
    }

    std::time_t now = std::time(nullptr);
    std::tm today{};
    localtime_r(&now, &today);

    const std::string body = ResponseParser::buildRequest(today).dump();
    DEBUG_LOG("POST " << config_.url << " " << body);

    HttpResponse response = session_->post(config_.url, body, requestHeaders(),
                                           config_.timeout_ms, config_.max_retries);

    if (response.status != 200) {
        throw PriceApiError("API request failed with status " +
                            std::to_string(response.status));
    }

    json data;
    try {
        data = json::parse(response.body);
    } catch (const json::exception& e) {
        throw PriceApiError(std::string("Invalid JSON in API response: ") + e.what());
    }

    return seriesFromKeyed(ResponseParser::parse(data, today));
}

#pragma once

#include "app_config.hpp"
#include "http_client.hpp"
#include "price_source.hpp"
#include <memory>
#include <vector>

// Green Planet Energy dynamic tariff endpoint (JSON-RPC over HTTPS)
class GreenPlanetSource : public IPriceSource {
public:
    explicit GreenPlanetSource(SourceConfig config);
    ~GreenPlanetSource() override;

    void open() override;
    void close() override;
    bool isOpen() const override { return session_ != nullptr; }

    PriceSeries fetchSnapshot() override;

    std::string getName() const override { return "GreenPlanet"; }

    static std::vector<std::string> requestHeaders();

private:
    SourceConfig config_;
    std::unique_ptr<HTTPClient> session_;
};

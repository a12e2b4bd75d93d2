#pragma once

#include "snapshot.hpp"
#include <nlohmann/json.hpp>
#include <ctime>
#include <string>

// Vendor JSON-RPC payloads. Timestamps look like "04.08.25, 09:00 Uhr" and
// prices use a decimal comma ("0,25").
class ResponseParser {
public:
    static constexpr const char* RPC_METHOD = "getVerbrauchspreisUndWindsignal";
    static constexpr int RPC_ID = 564;

    // Request body for the today/tomorrow price range starting at `today`
    static nlohmann::json buildRequest(const std::tm& today);

    // Keyed prices for today and tomorrow. A vendor errorCode throws
    // PriceApiError; a malformed result gives an empty map.
    static KeyedPrices parse(const nlohmann::json& response, const std::tm& today);

    // "DD.MM.YY" / "YYYY-MM-DD" for `day` shifted by `offset_days`
    static std::string formatVendorDate(const std::tm& day, int offset_days = 0);
    static std::string formatIsoDate(const std::tm& day, int offset_days = 0);

    // Accepts "0,25", "0.25" or a JSON number; nullopt if unparsable
    static std::optional<double> parsePrice(const nlohmann::json& value);
};

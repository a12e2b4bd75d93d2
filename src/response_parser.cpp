#include "response_parser.hpp"
#include "debug_log.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

using json = nlohmann::json;

namespace {

std::string formatDate(const std::tm& day, int offset_days, const char* format) {
    std::tm shifted = day;
    shifted.tm_mday += offset_days;
    shifted.tm_isdst = -1;
    std::mktime(&shifted);  // normalizes month/year rollover

    char buffer[16];
    std::strftime(buffer, sizeof(buffer), format, &shifted);
    return buffer;
}

struct VendorTimestamp {
    std::string date;
    int hour = -1;
};

// Splits "04.08.25, 09:00 Uhr" into date and hour; throws on malformed input
VendorTimestamp splitTimestamp(const std::string& timestamp) {
    const size_t comma = timestamp.find(", ");
    if (comma == std::string::npos) {
        throw std::invalid_argument("missing date separator");
    }

    std::string time_part = timestamp.substr(comma + 2);
    const size_t suffix = time_part.find(" Uhr");
    time_part = time_part.substr(0, suffix);

    const size_t colon = time_part.find(':');
    size_t consumed = 0;
    const std::string hour_text = time_part.substr(0, colon);
    int hour = std::stoi(hour_text, &consumed);
    if (consumed != hour_text.size() || hour < 0 || hour >= HOURS_PER_DAY) {
        throw std::invalid_argument("bad hour '" + hour_text + "'");
    }

    return VendorTimestamp{timestamp.substr(0, comma), hour};
}

}  // namespace

std::string ResponseParser::formatVendorDate(const std::tm& day, int offset_days) {
    return formatDate(day, offset_days, "%d.%m.%y");
}

std::string ResponseParser::formatIsoDate(const std::tm& day, int offset_days) {
    return formatDate(day, offset_days, "%Y-%m-%d");
}

json ResponseParser::buildRequest(const std::tm& today) {
    return json{
        {"jsonrpc", "2.0"},
        {"method", RPC_METHOD},
        {"params", {
            {"von", formatIsoDate(today)},
            {"bis", formatIsoDate(today, 1)},
            {"aggregatsZeitraum", ""},
            {"aggregatsTyp", ""},
            {"source", "Portal"}
        }},
        {"id", RPC_ID}
    };
}

std::optional<double> ResponseParser::parsePrice(const json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (!value.is_string()) {
        return std::nullopt;
    }

    std::string text = value.get<std::string>();
    std::replace(text.begin(), text.end(), ',', '.');

    try {
        size_t consumed = 0;
        double price = std::stod(text, &consumed);
        if (consumed != text.size() || !std::isfinite(price)) {
            return std::nullopt;
        }
        return price;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

KeyedPrices ResponseParser::parse(const json& response, const std::tm& today) {
    KeyedPrices prices;

    if (!response.is_object() || !response.contains("result") ||
        !response["result"].is_object()) {
        WARN_LOG("No result data in API response");
        return prices;
    }

    const json& result = response["result"];

    if (result.contains("errorCode") && result["errorCode"].is_number() &&
        result["errorCode"].get<long long>() != 0) {
        std::string error_text = "Unknown API error";
        if (result.contains("errorText") && result["errorText"].is_string()) {
            error_text = result["errorText"].get<std::string>();
        }
        throw PriceApiError("API returned error: " + error_text + " (code: " +
                            std::to_string(result["errorCode"].get<long long>()) + ")");
    }

    const json empty = json::array();
    const json& datum = result.contains("datum") ? result["datum"] : empty;
    const json& wert = result.contains("wert") ? result["wert"] : empty;

    if (!datum.is_array() || !wert.is_array() || datum.empty() || wert.empty() ||
        datum.size() != wert.size()) {
        WARN_LOG("Invalid or missing price data in API response");
        return prices;
    }

    const std::string today_str = formatVendorDate(today);
    const std::string tomorrow_str = formatVendorDate(today, 1);

    for (size_t i = 0; i < datum.size(); ++i) {
        if (!datum[i].is_string()) {
            DEBUG_LOG("Skipping non-string timestamp at index " << i);
            continue;
        }

        const std::string timestamp = datum[i].get<std::string>();
        if (timestamp.find(" Uhr") == std::string::npos) {
            continue;
        }

        VendorTimestamp parsed;
        try {
            parsed = splitTimestamp(timestamp);
        } catch (const std::exception& e) {
            DEBUG_LOG("Error parsing price data at index " << i << ": " << e.what());
            continue;
        }

        Day day;
        if (parsed.date == today_str) {
            day = Day::TODAY;
        } else if (parsed.date == tomorrow_str) {
            day = Day::TOMORROW;
        } else {
            continue;
        }

        auto price = parsePrice(wert[i]);
        if (!price) {
            DEBUG_LOG("Error parsing price data at index " << i << ": "
                     << wert[i].dump());
            continue;
        }
        if (*price < 0.0) {
            WARN_LOG("Skipping negative price " << *price << " at " << timestamp);
            continue;
        }

        prices[slotKey(Slot(day, parsed.hour))] = *price;
    }

    DEBUG_LOG("Processed " << prices.size() << " electricity prices");
    return prices;
}

#include "snapshot.hpp"
#include "debug_log.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

const std::string KEY_PREFIX = "price_";
const std::string TOMORROW_SUFFIX = "_tomorrow";

}  // namespace

std::string slotKey(Slot slot) {
    char hour[3];
    std::snprintf(hour, sizeof(hour), "%02d", slot.hour);
    std::string key = KEY_PREFIX + hour;
    if (slot.day == Day::TOMORROW) {
        key += TOMORROW_SUFFIX;
    }
    return key;
}

std::optional<Slot> parseSlotKey(const std::string& key) {
    if (key.compare(0, KEY_PREFIX.size(), KEY_PREFIX) != 0) {
        return std::nullopt;
    }

    const size_t pos = KEY_PREFIX.size();
    if (key.size() < pos + 2 ||
        !std::isdigit(static_cast<unsigned char>(key[pos])) ||
        !std::isdigit(static_cast<unsigned char>(key[pos + 1]))) {
        return std::nullopt;
    }

    const int hour = (key[pos] - '0') * 10 + (key[pos + 1] - '0');
    if (hour >= HOURS_PER_DAY) {
        return std::nullopt;
    }

    const std::string rest = key.substr(pos + 2);
    if (rest.empty()) {
        return Slot(Day::TODAY, hour);
    }
    if (rest == TOMORROW_SUFFIX) {
        return Slot(Day::TOMORROW, hour);
    }
    return std::nullopt;
}

PriceSeries seriesFromKeyed(const KeyedPrices& keyed) {
    std::map<Slot, Price> prices;

    for (const auto& [key, price] : keyed) {
        auto slot = parseSlotKey(key);
        if (!slot) {
            WARN_LOG("Ignoring unknown price key '" << key << "'");
            continue;
        }
        prices.emplace(*slot, price);
    }

    return PriceSeries(prices);
}

KeyedPrices keyedFromSeries(const PriceSeries& series) {
    KeyedPrices keyed;
    for (const auto& entry : series.materialize(Period::FULL)) {
        keyed.emplace(slotKey(entry.slot), entry.price);
    }
    return keyed;
}

PriceSeries loadSnapshotFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open snapshot file: " + path);
    }

    json snapshot;
    try {
        file >> snapshot;
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid snapshot file " + path + ": " + e.what());
    }

    if (!snapshot.is_object()) {
        throw std::runtime_error("Snapshot file must hold a JSON object: " + path);
    }

    KeyedPrices keyed;
    for (const auto& item : snapshot.items()) {
        if (!item.value().is_number()) {
            WARN_LOG("Skipping non-numeric price for '" << item.key() << "'");
            continue;
        }
        keyed.emplace(item.key(), item.value().get<double>());
    }

    DEBUG_LOG("Loaded " << keyed.size() << " prices from " << path);
    return seriesFromKeyed(keyed);
}

#pragma once

#include "price_series.hpp"
#include "types.hpp"
#include <map>
#include <optional>
#include <string>

// Wire keys: "price_HH" for today, "price_HH_tomorrow" for tomorrow
using KeyedPrices = std::map<std::string, double>;

std::string slotKey(Slot slot);
std::optional<Slot> parseSlotKey(const std::string& key);

// Unknown keys are reported and skipped
PriceSeries seriesFromKeyed(const KeyedPrices& keyed);
KeyedPrices keyedFromSeries(const PriceSeries& series);

// Reads a flat JSON object of wire keys. Throws std::runtime_error when the
// file cannot be opened or does not hold a JSON object.
PriceSeries loadSnapshotFile(const std::string& path);

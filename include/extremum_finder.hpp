#pragma once

#include "price_series.hpp"
#include "types.hpp"
#include <optional>

// Single-hour lookups. Ties resolve to the earliest hour in the period's
// chronological order.
class ExtremumFinder {
public:
    static HourQuote highestToday(const PriceSeries& series);

    static HourQuote lowestInPeriod(
        const PriceSeries& series,
        Period period,
        std::optional<int> reference_hour = std::nullopt);

    // Today's price at `hour`; throws std::invalid_argument outside 0-23
    static std::optional<Price> currentPrice(const PriceSeries& series, int hour);

    static std::optional<Price> highestPriceToday(const PriceSeries& series);
    static std::optional<Price> lowestPriceDay(const PriceSeries& series);
    static std::optional<Price> lowestPriceNight(const PriceSeries& series);
};

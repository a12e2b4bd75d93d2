#pragma once

#include "price_series.hpp"
#include "types.hpp"
#include <optional>

// Hours of coverage a window may fall short by before it is rejected
constexpr double COVERAGE_TOLERANCE = 0.01;

class WindowSearch {
public:
    // Cheapest contiguous run of `duration` hours (may be fractional) over the
    // period's populated slots. The average is total cost / duration, with a
    // fractional trailing slot weighted by the fraction. Ties keep the earliest
    // start. A non-positive duration, or too little data, gives found == false.
    static WindowResult cheapestWindow(
        const PriceSeries& series,
        Period period,
        double duration,
        std::optional<int> reference_hour = std::nullopt);

    static WindowResult cheapestDayWindow(
        const PriceSeries& series,
        double duration,
        std::optional<int> reference_hour = std::nullopt);

    static WindowResult cheapestNightWindow(
        const PriceSeries& series,
        double duration,
        std::optional<int> reference_hour = std::nullopt);

    static WindowResult cheapestFullWindow(
        const PriceSeries& series,
        double duration,
        std::optional<int> reference_hour = std::nullopt);
};

#include "extremum_finder.hpp"
#include "window_search.hpp"
#include <stdexcept>
#include <string>

namespace {

std::optional<Price> priceOf(const HourQuote& quote) {
    if (!quote.found) return std::nullopt;
    return quote.price;
}

}  // namespace

HourQuote ExtremumFinder::highestToday(const PriceSeries& series) {
    HourQuote best;

    for (const auto& entry : series.materialize(Period::TODAY)) {
        if (!best.found || entry.price > best.price) {
            best = HourQuote(entry.price, entry.slot.hour);
        }
    }

    return best;
}

HourQuote ExtremumFinder::lowestInPeriod(
    const PriceSeries& series,
    Period period,
    std::optional<int> reference_hour) {
    // A one-hour window is a single slot, so its average is the slot price
    return WindowSearch::cheapestWindow(series, period, 1.0, reference_hour).toHourQuote();
}

std::optional<Price> ExtremumFinder::currentPrice(const PriceSeries& series, int hour) {
    if (hour < 0 || hour >= HOURS_PER_DAY) {
        throw std::invalid_argument("Hour must be between 0 and 23, got " +
                                    std::to_string(hour));
    }
    return series.valueAt(Slot(Day::TODAY, hour));
}

std::optional<Price> ExtremumFinder::highestPriceToday(const PriceSeries& series) {
    return priceOf(highestToday(series));
}

std::optional<Price> ExtremumFinder::lowestPriceDay(const PriceSeries& series) {
    return priceOf(lowestInPeriod(series, Period::DAY));
}

std::optional<Price> ExtremumFinder::lowestPriceNight(const PriceSeries& series) {
    return priceOf(lowestInPeriod(series, Period::NIGHT));
}

#include "window_search.hpp"
#include "debug_log.hpp"
#include <cmath>

WindowResult WindowSearch::cheapestWindow(
    const PriceSeries& series,
    Period period,
    double duration,
    std::optional<int> reference_hour) {

    WindowResult result;

    // Validates the reference hour before any early return
    const std::vector<PricedSlot> slots = series.materialize(period, reference_hour);

    if (!std::isfinite(duration) || duration <= 0.0) {
        DEBUG_LOG("Window search: invalid duration " << duration);
        return result;
    }

    // Too few populated hours to cover ceil(duration)
    if (std::ceil(duration) > static_cast<double>(slots.size())) {
        DEBUG_LOG("Window search: " << slots.size() << " slots in "
                 << periodName(period) << ", need " << std::ceil(duration));
        return result;
    }

    const size_t full_slots = static_cast<size_t>(std::floor(duration));
    const double fraction = duration - static_cast<double>(full_slots);

    DEBUG_LOG("\n=== WINDOW SEARCH (" << periodName(period) << ") ===");
    DEBUG_LOG("Duration: " << duration << "h (" << full_slots << " full + "
             << fraction << ")");
    DEBUG_LOG("Available slots: " << slots.size());

    for (size_t i = 0; i < slots.size(); ++i) {
        if (i + full_slots > slots.size()) break;

        Price total_cost = 0.0;
        double covered_hours = 0.0;

        for (size_t j = i; j < i + full_slots; ++j) {
            total_cost += slots[j].price;
            covered_hours += 1.0;
        }

        size_t spanned = full_slots;
        if (fraction > 0.0) {
            // The trailing partial hour needs a slot of its own
            if (i + full_slots >= slots.size()) break;
            total_cost += slots[i + full_slots].price * fraction;
            covered_hours += fraction;
            ++spanned;
        }

        if (covered_hours < duration - COVERAGE_TOLERANCE) {
            continue;
        }

        const Price average = total_cost / duration;

        DEBUG_LOG("Start " << slots[i].slot.hour << " " << dayName(slots[i].slot.day)
                 << ": cost " << total_cost << ", average " << average);

        // Strict improvement only: ties keep the earliest window
        if (!result.found || average < result.average_price) {
            result.average_price = average;
            result.start_hour = slots[i].slot.hour;
            result.start_day = slots[i].slot.day;
            result.slots_spanned = static_cast<int>(spanned);
            result.found = true;
        }
    }

    DEBUG_LOG("Best: " << (result.found ? std::to_string(result.average_price) : "none")
             << " at hour " << result.start_hour << "\n");

    return result;
}

WindowResult WindowSearch::cheapestDayWindow(
    const PriceSeries& series,
    double duration,
    std::optional<int> reference_hour) {
    return cheapestWindow(series, Period::DAY, duration, reference_hour);
}

WindowResult WindowSearch::cheapestNightWindow(
    const PriceSeries& series,
    double duration,
    std::optional<int> reference_hour) {
    return cheapestWindow(series, Period::NIGHT, duration, reference_hour);
}

WindowResult WindowSearch::cheapestFullWindow(
    const PriceSeries& series,
    double duration,
    std::optional<int> reference_hour) {
    return cheapestWindow(series, Period::FULL, duration, reference_hour);
}

#include "price_series.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace {

void appendHours(std::vector<Slot>& slots, Day day, int first, int last) {
    for (int hour = first; hour <= last; ++hour) {
        slots.emplace_back(day, hour);
    }
}

void checkReferenceHour(std::optional<int> reference_hour) {
    if (reference_hour && (*reference_hour < 0 || *reference_hour >= HOURS_PER_DAY)) {
        throw std::invalid_argument(
            "Reference hour out of range: " + std::to_string(*reference_hour));
    }
}

}  // namespace

PriceSeries::PriceSeries(const std::map<Slot, Price>& prices) {
    for (const auto& [slot, price] : prices) {
        if (!slot.isValid()) {
            throw std::invalid_argument("Invalid hour in price series: " +
                                        std::to_string(slot.hour));
        }
        if (!std::isfinite(price) || price < 0.0) {
            throw std::invalid_argument("Invalid price for hour " +
                                        std::to_string(slot.hour) + " " +
                                        dayName(slot.day));
        }
        prices_[slot.index()] = price;
    }
    count_ = prices.size();
}

std::optional<Price> PriceSeries::valueAt(Slot slot) const {
    if (!slot.isValid()) {
        throw std::out_of_range("Hour out of range: " + std::to_string(slot.hour));
    }
    return prices_[slot.index()];
}

std::vector<Slot> PriceSeries::periodSlots(Period period) {
    std::vector<Slot> slots;
    slots.reserve(SLOT_COUNT);

    switch (period) {
        case Period::DAY:
            appendHours(slots, Day::TODAY, DAY_START_HOUR, NIGHT_START_HOUR - 1);
            break;
        case Period::NIGHT:
            // Wraps midnight: evening today, then early morning tomorrow
            appendHours(slots, Day::TODAY, NIGHT_START_HOUR, HOURS_PER_DAY - 1);
            appendHours(slots, Day::TOMORROW, 0, DAY_START_HOUR - 1);
            break;
        case Period::FULL:
            appendHours(slots, Day::TODAY, 0, HOURS_PER_DAY - 1);
            appendHours(slots, Day::TOMORROW, 0, HOURS_PER_DAY - 1);
            break;
        case Period::TODAY:
            appendHours(slots, Day::TODAY, 0, HOURS_PER_DAY - 1);
            break;
    }

    return slots;
}

std::vector<PricedSlot> PriceSeries::materialize(
    Period period,
    std::optional<int> reference_hour) const {

    checkReferenceHour(reference_hour);

    std::vector<PricedSlot> result;
    if (empty()) {
        return result;
    }

    for (const auto& slot : periodSlots(period)) {
        // Hours already elapsed today are not candidates
        if (reference_hour && slot.day == Day::TODAY && slot.hour < *reference_hour) {
            continue;
        }

        const auto& price = prices_[slot.index()];
        if (price) {
            result.emplace_back(slot, *price);
        }
    }

    return result;
}

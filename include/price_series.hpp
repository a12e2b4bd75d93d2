#pragma once

#include "types.hpp"
#include <array>
#include <map>
#include <optional>
#include <vector>

// Immutable two-day hourly price map. Absent slots have no data; they are
// never treated as a zero price.
class PriceSeries {
public:
    PriceSeries() = default;

    // Throws std::invalid_argument on an invalid hour or a negative/non-finite price
    explicit PriceSeries(const std::map<Slot, Price>& prices);

    std::optional<Price> valueAt(Slot slot) const;

    // Populated slots of the period in chronological order. With a reference
    // hour, today's slots before it are dropped; tomorrow's never are.
    std::vector<PricedSlot> materialize(
        Period period,
        std::optional<int> reference_hour = std::nullopt) const;

    // Every slot belonging to the period, populated or not
    static std::vector<Slot> periodSlots(Period period);

    [[nodiscard]] size_t size() const noexcept { return count_; }
    [[nodiscard]] bool empty() const noexcept { return count_ == 0; }

private:
    std::array<std::optional<Price>, SLOT_COUNT> prices_{};
    size_t count_ = 0;
};

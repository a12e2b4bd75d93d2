#pragma once

#include <string>
#include <cstdint>

// Calendar day a slot resolves to
enum class Day : uint8_t {
    TODAY = 0,
    TOMORROW = 1
};

// Recurring daily bands the queries run over
enum class Period : uint8_t {
    DAY = 0,       // 06-17 today
    NIGHT = 1,     // 18-23 today, 00-05 tomorrow
    FULL = 2,      // 00-23 today, 00-23 tomorrow
    TODAY = 3      // 00-23 today
};

using Price = double;

constexpr int HOURS_PER_DAY = 24;
constexpr int SLOT_COUNT = 2 * HOURS_PER_DAY;

constexpr int DAY_START_HOUR = 6;
constexpr int NIGHT_START_HOUR = 18;

// One addressable hour of the two-day series
struct Slot {
    Day day;
    int hour;   // 0-23

    constexpr Slot(Day d, int h) : day(d), hour(h) {}

    // Position in the flat 48-entry storage, today first
    [[nodiscard]] constexpr int index() const noexcept {
        return static_cast<int>(day) * HOURS_PER_DAY + hour;
    }

    [[nodiscard]] constexpr bool isValid() const noexcept {
        return hour >= 0 && hour < HOURS_PER_DAY;
    }

    bool operator==(const Slot& other) const noexcept {
        return day == other.day && hour == other.hour;
    }

    bool operator!=(const Slot& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const Slot& other) const noexcept {
        return index() < other.index();
    }
};

struct PricedSlot {
    Slot slot;
    Price price;

    PricedSlot(Slot s, Price p) : slot(s), price(p) {}
};

// Single-hour extremum; found == false means no data
struct HourQuote {
    Price price;
    int hour;
    bool found;

    HourQuote() : price(0.0), hour(-1), found(false) {}
    HourQuote(Price p, int h) : price(p), hour(h), found(true) {}
};

// Best window placement; found == false means no window could be formed
struct WindowResult {
    Price average_price;
    int start_hour;
    Day start_day;
    int slots_spanned;
    bool found;

    WindowResult()
        : average_price(0.0), start_hour(-1), start_day(Day::TODAY),
          slots_spanned(0), found(false) {}

    [[nodiscard]] HourQuote toHourQuote() const noexcept {
        return found ? HourQuote(average_price, start_hour) : HourQuote();
    }
};

inline const char* dayName(Day day) {
    switch (day) {
        case Day::TODAY: return "today";
        case Day::TOMORROW: return "tomorrow";
        default: return "unknown";
    }
}

inline const char* periodName(Period period) {
    switch (period) {
        case Period::DAY: return "Day";
        case Period::NIGHT: return "Night";
        case Period::FULL: return "Full";
        case Period::TODAY: return "Today";
        default: return "Unknown";
    }
}

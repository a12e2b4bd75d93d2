#include <iostream>
#include <cassert>
#include <map>
#include <stdexcept>
#include "extremum_finder.hpp"
#include "test_fixtures.hpp"

void test_highest_today() {
    std::cout << "=== Testing Highest Today ===\n";

    PriceSeries series = samplePriceSeries();
    auto quote = ExtremumFinder::highestToday(series);
    assert(quote.found);
    assert(near(quote.price, 0.32));
    assert(quote.hour == 11);
    assert(near(ExtremumFinder::highestPriceToday(series).value(), 0.32));
    std::cout << "  ✓ PASS 0.32 at 11:00\n";

    // Tomorrow never counts towards today's peak
    std::map<Slot, Price> prices{
        {Slot(Day::TODAY, 3), 0.40},
        {Slot(Day::TODAY, 15), 0.40},
        {Slot(Day::TOMORROW, 8), 0.90}};
    quote = ExtremumFinder::highestToday(PriceSeries(prices));
    assert(quote.found && near(quote.price, 0.40) && quote.hour == 3);
    std::cout << "  ✓ PASS ties resolve to the earliest hour\n\n";
}

void test_lowest_in_period() {
    std::cout << "=== Testing Lowest In Period ===\n";

    PriceSeries series = samplePriceSeries();

    auto day = ExtremumFinder::lowestInPeriod(series, Period::DAY);
    assert(day.found && near(day.price, 0.21) && day.hour == 17);
    assert(near(ExtremumFinder::lowestPriceDay(series).value(), 0.21));
    std::cout << "  ✓ PASS day: 0.21 at 17:00\n";

    auto night = ExtremumFinder::lowestInPeriod(series, Period::NIGHT);
    assert(night.found && near(night.price, 0.10) && night.hour == 4);
    assert(near(ExtremumFinder::lowestPriceNight(series).value(), 0.10));
    std::cout << "  ✓ PASS night: 0.10 at 04:00 tomorrow\n";

    // 23:00 today scans before 02:00 tomorrow
    std::map<Slot, Price> prices{
        {Slot(Day::TODAY, 19), 0.30},
        {Slot(Day::TODAY, 23), 0.10},
        {Slot(Day::TOMORROW, 2), 0.10}};
    night = ExtremumFinder::lowestInPeriod(PriceSeries(prices), Period::NIGHT);
    assert(night.found && night.hour == 23);
    std::cout << "  ✓ PASS night tie keeps the evening hour\n";

    night = ExtremumFinder::lowestInPeriod(PriceSeries(prices), Period::NIGHT, 20);
    assert(night.found && night.hour == 23);
    std::cout << "  ✓ PASS reference hour applies to extrema\n\n";
}

void test_current_price() {
    std::cout << "=== Testing Current Price ===\n";

    PriceSeries series = samplePriceSeries();
    assert(near(ExtremumFinder::currentPrice(series, 10).value(), 0.30));
    assert(near(ExtremumFinder::currentPrice(series, 0).value(), 0.20));
    std::cout << "  ✓ PASS 10:00 = 0.30\n";

    std::map<Slot, Price> tomorrow_only{{Slot(Day::TOMORROW, 10), 0.50}};
    assert(!ExtremumFinder::currentPrice(PriceSeries(tomorrow_only), 10));
    std::cout << "  ✓ PASS reads today only\n";

    for (int bad : {-1, 24}) {
        bool threw = false;
        try {
            (void)ExtremumFinder::currentPrice(series, bad);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }
    std::cout << "  ✓ PASS out-of-range hours rejected\n\n";
}

void test_empty_series() {
    std::cout << "=== Testing Empty Series ===\n";

    PriceSeries empty;
    assert(!ExtremumFinder::highestToday(empty).found);
    assert(ExtremumFinder::highestToday(empty).hour == -1);
    assert(!ExtremumFinder::lowestInPeriod(empty, Period::DAY).found);
    assert(!ExtremumFinder::lowestInPeriod(empty, Period::NIGHT).found);
    assert(!ExtremumFinder::currentPrice(empty, 10));
    assert(!ExtremumFinder::highestPriceToday(empty));
    assert(!ExtremumFinder::lowestPriceDay(empty));
    assert(!ExtremumFinder::lowestPriceNight(empty));
    std::cout << "  ✓ PASS every lookup is absent\n\n";
}

int main() {
    test_highest_today();
    test_lowest_in_period();
    test_current_price();
    test_empty_series();
    std::cout << "All tests passed! ✓\n";
    return 0;
}

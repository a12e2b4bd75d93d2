#include <iostream>
#include <cassert>
#include <cstdio>
#include <ctime>
#include <string>
#include <nlohmann/json.hpp>
#include "errors.hpp"
#include "response_parser.hpp"
#include "test_fixtures.hpp"

using json = nlohmann::json;

std::tm makeDate(int year, int month, int day) {
    std::tm date{};
    date.tm_year = year - 1900;
    date.tm_mon = month - 1;
    date.tm_mday = day;
    date.tm_hour = 12;
    date.tm_isdst = -1;
    return date;
}

// Vendor-style decimal comma, e.g. 0.2 -> "0,20"
std::string commaPrice(double value) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%.2f", value);
    std::string text = buffer;
    text[text.find('.')] = ',';
    return text;
}

std::string vendorTimestamp(const std::string& date, int hour) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%s, %02d:00 Uhr", date.c_str(), hour);
    return buffer;
}

json twoDayResponse() {
    json datum = json::array();
    json wert = json::array();
    for (int hour = 0; hour < 24; ++hour) {
        datum.push_back(vendorTimestamp("04.08.25", hour));
        wert.push_back(commaPrice(0.20 + hour * 0.01));
    }
    for (int hour = 0; hour < 24; ++hour) {
        datum.push_back(vendorTimestamp("05.08.25", hour));
        wert.push_back(commaPrice(0.25 + hour * 0.01));
    }
    return json{{"result", {{"errorCode", 0}, {"datum", datum}, {"wert", wert}}}};
}

void test_two_day_response() {
    std::cout << "=== Testing Two-Day Response ===\n";

    KeyedPrices prices = ResponseParser::parse(twoDayResponse(), makeDate(2025, 8, 4));
    assert(prices.size() == 48);

    for (int hour = 0; hour < 24; ++hour) {
        assert(near(prices.at(slotKey(Slot(Day::TODAY, hour))), 0.20 + hour * 0.01, 0.001));
        assert(near(prices.at(slotKey(Slot(Day::TOMORROW, hour))), 0.25 + hour * 0.01, 0.001));
    }
    std::cout << "  ✓ PASS 48 prices, comma decimals converted\n";

    PriceSeries series = seriesFromKeyed(prices);
    assert(series.size() == 48);
    std::cout << "  ✓ PASS feeds a complete series\n\n";
}

void test_vendor_error() {
    std::cout << "=== Testing Vendor Error ===\n";

    json response{{"result", {{"errorCode", 1}, {"errorText", "API Error occurred"}}}};
    bool threw = false;
    try {
        (void)ResponseParser::parse(response, makeDate(2025, 8, 4));
    } catch (const PriceApiError& e) {
        threw = true;
        assert(std::string(e.what()).find("API Error occurred") != std::string::npos);
        assert(std::string(e.what()).find("(code: 1)") != std::string::npos);
    }
    assert(threw);
    std::cout << "  ✓ PASS errorCode throws PriceApiError\n\n";
}

void test_malformed_responses() {
    std::cout << "=== Testing Malformed Responses ===\n";

    const std::tm today = makeDate(2025, 8, 4);

    assert(ResponseParser::parse(json{{"invalid", "response"}}, today).empty());
    assert(ResponseParser::parse(json::array(), today).empty());
    std::cout << "  ✓ PASS missing result is empty\n";

    json uneven{{"result", {{"errorCode", 0},
                            {"datum", json::array({vendorTimestamp("04.08.25", 1)})},
                            {"wert", json::array()}}}};
    assert(ResponseParser::parse(uneven, today).empty());
    std::cout << "  ✓ PASS mismatched arrays are empty\n";

    json mixed{{"result", {{"errorCode", 0},
        {"datum", json::array({
            vendorTimestamp("04.08.25", 1),   // kept
            vendorTimestamp("03.08.25", 2),   // yesterday
            "04.08.25, 03:00",                // no " Uhr"
            "04.08.25 04:00 Uhr",             // no separator
            vendorTimestamp("04.08.25", 5),   // bad price
            vendorTimestamp("05.08.25", 6),   // kept
            "04.08.25, xx:00 Uhr",            // bad hour
            vendorTimestamp("04.08.25", 7)})},  // numeric price
        {"wert", json::array({"0,31", "0,10", "0,10", "0,10", "abc", "0,42", "0,10", 0.5})}}}};

    KeyedPrices prices = ResponseParser::parse(mixed, today);
    assert(prices.size() == 3);
    assert(near(prices.at("price_01"), 0.31));
    assert(near(prices.at("price_06_tomorrow"), 0.42));
    assert(near(prices.at("price_07"), 0.5));
    std::cout << "  ✓ PASS unparsable entries skipped\n\n";
}

void test_dates_and_request() {
    std::cout << "=== Testing Dates And Request ===\n";

    const std::tm new_year_eve = makeDate(2025, 12, 31);
    assert(ResponseParser::formatVendorDate(new_year_eve) == "31.12.25");
    assert(ResponseParser::formatVendorDate(new_year_eve, 1) == "01.01.26");
    assert(ResponseParser::formatIsoDate(new_year_eve, 1) == "2026-01-01");
    std::cout << "  ✓ PASS tomorrow rolls over the year\n";

    json request = ResponseParser::buildRequest(makeDate(2025, 8, 4));
    assert(request["jsonrpc"] == "2.0");
    assert(request["method"] == "getVerbrauchspreisUndWindsignal");
    assert(request["id"] == 564);
    assert(request["params"]["von"] == "2025-08-04");
    assert(request["params"]["bis"] == "2025-08-05");
    assert(request["params"]["source"] == "Portal");
    assert(request["params"]["aggregatsZeitraum"] == "");
    std::cout << "  ✓ PASS JSON-RPC request body\n";

    assert(near(ResponseParser::parsePrice(json("0,25")).value(), 0.25));
    assert(near(ResponseParser::parsePrice(json("0.25")).value(), 0.25));
    assert(near(ResponseParser::parsePrice(json(0.25)).value(), 0.25));
    assert(!ResponseParser::parsePrice(json("0,25 EUR")));
    assert(!ResponseParser::parsePrice(json(nullptr)));
    std::cout << "  ✓ PASS price text formats\n\n";
}

int main() {
    test_two_day_response();
    test_vendor_error();
    test_malformed_responses();
    test_dates_and_request();
    std::cout << "All tests passed! ✓\n";
    return 0;
}

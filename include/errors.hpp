#pragma once

#include <stdexcept>
#include <string>

// Failures while fetching a snapshot from the vendor. The window engine
// never throws these.
class PriceFetchError : public std::runtime_error {
public:
    explicit PriceFetchError(const std::string& what) : std::runtime_error(what) {}
};

// Vendor rejected the request: bad HTTP status or a non-zero errorCode
class PriceApiError : public PriceFetchError {
public:
    explicit PriceApiError(const std::string& what) : PriceFetchError(what) {}
};

// Transport problems: timeouts, connection failures, no open session
class PriceConnectionError : public PriceFetchError {
public:
    explicit PriceConnectionError(const std::string& what) : PriceFetchError(what) {}
};

#pragma once

#include "price_series.hpp"
#include <string>

// Anything that can hand over a completed two-day price snapshot
class IPriceSource {
public:
    virtual ~IPriceSource() = default;

    virtual void open() = 0;
    virtual void close() = 0;
    [[nodiscard]] virtual bool isOpen() const = 0;

    // Throws PriceFetchError subclasses (or std::runtime_error for file I/O)
    virtual PriceSeries fetchSnapshot() = 0;

    virtual std::string getName() const = 0;
};

// Opens a source for the lifetime of the guard
class ScopedSession {
public:
    explicit ScopedSession(IPriceSource& source) : source_(source) {
        source_.open();
    }

    ~ScopedSession() {
        source_.close();
    }

    ScopedSession(const ScopedSession&) = delete;
    ScopedSession& operator=(const ScopedSession&) = delete;

private:
    IPriceSource& source_;
};

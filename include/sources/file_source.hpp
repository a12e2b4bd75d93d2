#pragma once

#include "price_source.hpp"
#include <string>
#include <utility>

// Reads a snapshot saved as a flat JSON object of price_HH keys
class FileSource : public IPriceSource {
public:
    explicit FileSource(std::string path) : path_(std::move(path)) {}

    void open() override { open_ = true; }
    void close() override { open_ = false; }
    bool isOpen() const override { return open_; }

    PriceSeries fetchSnapshot() override;

    std::string getName() const override { return "File(" + path_ + ")"; }

private:
    std::string path_;
    bool open_ = false;
};

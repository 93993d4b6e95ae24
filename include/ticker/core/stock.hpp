#pragma once
#include <ticker/core/price_update.hpp>
#include <ticker/core/status.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ticker::core {

// Price history of a single symbol. Updates are kept in the order they were
// applied; the latest price is the one applied last, regardless of timestamp.
// Not thread safe, callers sharing an instance must synchronize externally.
class Stock {
private:
    std::string symbol_;
    std::vector<PriceUpdate> history_;

public:
    explicit Stock(std::string symbol);

    const std::string& symbol() const;

    // Appends a price observation. A negative (or NaN) price is rejected with
    // INVALID_ARGUMENT and leaves the history untouched.
    Status update(int64_t timestamp, double price);

    // Price of the most recent update, empty if none was ever recorded
    std::optional<double> price() const;

    // True when the last three prices are strictly increasing.
    // Fewer than three updates is never a trend.
    bool is_increasing_trend() const;

    const std::vector<PriceUpdate>& history() const {
        return history_;
    }
};

} // namespace ticker::core

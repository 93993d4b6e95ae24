#pragma once
#include <cstdint>

namespace ticker::core {

struct PriceUpdate {
    int64_t timestamp; // microseconds since epoch
    double price;

    PriceUpdate();
    PriceUpdate(int64_t ts, double p);
};

// Midnight UTC of the given civil date, in microseconds since epoch
int64_t make_timestamp(int year, unsigned month, unsigned day);

} // namespace ticker::core

#include <ticker/core/price_update.hpp>

namespace ticker::core {

PriceUpdate::PriceUpdate()
    : timestamp(0), price(0.0) {}

PriceUpdate::PriceUpdate(int64_t ts, double p)
    : timestamp(ts), price(p) {}

int64_t make_timestamp(int year, unsigned month, unsigned day) {
    // Proleptic Gregorian calendar, years shifted so that March is month 0
    year -= month <= 2 ? 1 : 0;
    const int64_t era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    const int64_t days = era * 146097 + static_cast<int64_t>(doe) - 719468;

    return days * 86400LL * 1000000LL;
}

} // namespace ticker::core

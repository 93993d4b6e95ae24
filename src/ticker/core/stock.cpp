#include <ticker/core/stock.hpp>
#include <ticker/utils/logger.hpp>
#include <utility>

namespace ticker::core {

namespace {
constexpr size_t TREND_WINDOW = 3;
}

Stock::Stock(std::string symbol)
    : symbol_(std::move(symbol)) {}

const std::string& Stock::symbol() const {
    return symbol_;
}

Status Stock::update(int64_t timestamp, double price) {
    // Written as !(price >= 0) so NaN is rejected too
    if (!(price >= 0.0)) {
        utils::Logger::warn() << "Rejected update for " << symbol_
                              << ": invalid price " << price
                              << utils::Logger::endl;
        return Status::invalid_argument("price must not be negative");
    }

    history_.emplace_back(timestamp, price);

    utils::Logger::debug() << symbol_ << " @ " << timestamp << " -> " << price
                           << " (" << history_.size() << " updates)"
                           << utils::Logger::endl;
    return Status::success();
}

std::optional<double> Stock::price() const {
    if (history_.empty()) {
        return std::nullopt;
    }
    return history_.back().price;
}

bool Stock::is_increasing_trend() const {
    if (history_.size() < TREND_WINDOW) {
        return false;
    }

    auto it = history_.end() - TREND_WINDOW;
    const double p1 = it[0].price;
    const double p2 = it[1].price;
    const double p3 = it[2].price;

    return p1 < p2 && p2 < p3;
}

} // namespace ticker::core

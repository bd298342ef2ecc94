#include "switchyard/variants/trading.h"
#include "switchyard/core/errors.h"
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <string>

namespace switchyard {
namespace variants {

namespace {

void requirePrices(const std::vector<double>& prices) {
    if (prices.empty()) {
        throw std::invalid_argument("price history must not be empty");
    }
}

} // namespace

std::string toString(Signal signal) {
    switch (signal) {
        case Signal::Buy:  return "buy";
        case Signal::Sell: return "sell";
        case Signal::Hold: return "hold";
    }
    return "unknown";
}

AverageSignal::AverageSignal(const core::Options& options) {
    const int window = options.get<int>("window_size", kDefaultWindow);
    if (window < 1) {
        throw core::ConfigurationError("window_size", "must be at least 1, got " + std::to_string(window));
    }
    windowSize_ = static_cast<std::size_t>(window);
}

Signal AverageSignal::perform(const std::vector<double>& prices) {
    requirePrices(prices);

    const std::size_t count = std::min(windowSize_, prices.size());
    const double sum = std::accumulate(prices.end() - static_cast<std::ptrdiff_t>(count),
                                       prices.end(), 0.0);
    const double mean = sum / static_cast<double>(count);
    const double last = prices.back();

    if (last < mean) {
        return Signal::Buy;
    }
    if (last > mean) {
        return Signal::Sell;
    }
    return Signal::Hold;
}

MinMaxSignal::MinMaxSignal(const core::Options& options)
    : minPrice_(options.get<double>("min_price", kDefaultMinPrice)),
      maxPrice_(options.get<double>("max_price", kDefaultMaxPrice)) {
    if (minPrice_ > maxPrice_) {
        throw core::ConfigurationError("min_price", "must not exceed max_price");
    }
}

Signal MinMaxSignal::perform(const std::vector<double>& prices) {
    requirePrices(prices);

    const double last = prices.back();
    if (last < minPrice_) {
        return Signal::Buy;
    }
    if (last > maxPrice_) {
        return Signal::Sell;
    }
    return Signal::Hold;
}

void registerSignalVariants(core::Registry<SignalCapability>& registry) {
    registry.registerType<AverageSignal>("average", "Latest price against trailing mean");
    registry.registerType<MinMaxSignal>("minmax", "Fixed floor and ceiling prices");
}

} // namespace variants
} // namespace switchyard

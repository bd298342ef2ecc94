#pragma once

#include "switchyard/core/capability.h"
#include "switchyard/core/options.h"
#include "switchyard/core/registry.h"
#include <cstddef>
#include <string>
#include <vector>

namespace switchyard {
namespace variants {

enum class Signal {
    Buy,
    Sell,
    Hold
};

std::string toString(Signal signal);

/// Maps a price history (oldest first) to a trading decision.
using SignalCapability = core::Capability<std::vector<double>, Signal>;

/**
 * @brief Compares the latest price with the mean of the trailing window.
 *
 * Option "window_size" (int >= 1, default 3). Buys below the mean, sells
 * above it. Shorter histories use every available price.
 */
class AverageSignal : public SignalCapability {
public:
    static constexpr int kDefaultWindow = 3;

    explicit AverageSignal(const core::Options& options = core::Options());

    std::string name() const override { return "average"; }
    Signal perform(const std::vector<double>& prices) override;

    std::size_t windowSize() const { return windowSize_; }

private:
    std::size_t windowSize_;
};

/**
 * @brief Buys under a floor price and sells over a ceiling price.
 *
 * Options "min_price" (default 32000.0) and "max_price" (default 33000.0);
 * min_price must not exceed max_price.
 */
class MinMaxSignal : public SignalCapability {
public:
    static constexpr double kDefaultMinPrice = 32000.0;
    static constexpr double kDefaultMaxPrice = 33000.0;

    explicit MinMaxSignal(const core::Options& options = core::Options());

    std::string name() const override { return "minmax"; }
    Signal perform(const std::vector<double>& prices) override;

private:
    double minPrice_;
    double maxPrice_;
};

/// Registers "average" and "minmax".
void registerSignalVariants(core::Registry<SignalCapability>& registry);

} // namespace variants
} // namespace switchyard

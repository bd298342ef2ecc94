#pragma once

#include "switchyard/core/capability.h"
#include "switchyard/core/errors.h"
#include "switchyard/core/options.h"
#include "switchyard/core/registry.h"
#include "switchyard/utils/logging.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <utility>

namespace switchyard {
namespace core {

/**
 * @brief Holder that forwards operation calls to the currently selected variant.
 *
 * A Context starts Unset. setStrategy() or selectFrom() makes it Ready, and
 * it stays Ready for the rest of its life; execute() never changes the state.
 *
 * Configuration is injected into variants when they are constructed. The
 * Context keeps its own Options and passes them to the registry creator on
 * selectFrom(). setConfiguration() rebuilds a registry-selected variant with
 * the new Options; a variant handed in through setStrategy() keeps the
 * configuration it was built with.
 *
 * Mutations are serialized against each other. Variants are constructed
 * outside the lock that guards the active variant, which is then swapped in
 * under an exclusive lock. execute() copies the active variant under a shared
 * lock and calls it outside the lock, so a running call keeps its variant
 * alive across a concurrent re-selection, and readers are never blocked while
 * a creator runs. A creator may call the read-only members of the Context it
 * is building for, but not setStrategy(), selectFrom() or setConfiguration().
 */
template <typename Input, typename Output>
class Context {
public:
    using Strategy = Capability<Input, Output>;
    using StrategyPtr = std::shared_ptr<Strategy>;
    using StrategyRegistry = Registry<Strategy>;

    Context() = default;

    explicit Context(StrategyPtr strategy) {
        setStrategy(std::move(strategy));
    }

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    /**
     * @brief Replace the active variant unconditionally.
     *
     * Accepts shared or unique ownership, e.g. the result of Registry::create().
     * @throws std::invalid_argument if strategy is null
     */
    void setStrategy(StrategyPtr strategy) {
        if (!strategy) {
            throw std::invalid_argument("strategy must not be null");
        }

        std::lock_guard<std::mutex> update(updateMutex_);
        SWLOG_DEBUG("selecting strategy '" << strategy->name() << "'");
        std::unique_lock<std::shared_mutex> lock(mutex_);
        strategy_ = std::move(strategy);
        source_.reset();
    }

    /**
     * @brief Build the variant registered under key with this context's Options
     * and make it active.
     *
     * On failure the previous state is kept.
     * @throws UnknownKeyError if key is not registered
     * @throws ConstructionError if the creator fails
     */
    void selectFrom(const StrategyRegistry& registry, const std::string& key) {
        auto creator = registry.creatorFor(key);

        std::lock_guard<std::mutex> update(updateMutex_);
        StrategyPtr strategy = StrategyRegistry::construct(key, creator, configuration());
        SWLOG_DEBUG("selecting strategy '" << key << "' from registry");

        std::unique_lock<std::shared_mutex> lock(mutex_);
        strategy_ = std::move(strategy);
        source_ = Source{key, std::move(creator)};
    }

    /**
     * @brief Replace the configuration.
     *
     * A variant chosen with selectFrom() is rebuilt with options and replaces
     * the current one. If the rebuild fails, neither the variant nor the
     * configuration changes.
     * @throws ConstructionError if rebuilding the active variant fails
     */
    void setConfiguration(Options options) {
        std::lock_guard<std::mutex> update(updateMutex_);
        std::optional<Source> source;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            source = source_;
        }

        StrategyPtr rebuilt;
        if (source) {
            rebuilt = StrategyRegistry::construct(source->key, source->creator, options);
            SWLOG_DEBUG("rebuilt strategy '" << source->key << "' with " << options.dump());
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (rebuilt) {
            strategy_ = std::move(rebuilt);
        }
        options_ = std::move(options);
    }

    /**
     * @brief Run the active variant's operation.
     *
     * Pass the operation's input, or nothing for Capability<void, Output>.
     * Exceptions from the variant propagate unchanged.
     * @throws NoStrategySelectedError if no strategy was ever selected
     */
    template <typename... Args>
    Output execute(const Args&... input) const {
        StrategyPtr strategy = current();
        return strategy->perform(input...);
    }

    bool hasStrategy() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return static_cast<bool>(strategy_);
    }

    /**
     * @throws NoStrategySelectedError if no strategy was ever selected
     */
    std::string strategyName() const {
        return current()->name();
    }

    /// Registry key of the active variant, empty for hand-built variants.
    std::optional<std::string> sourceKey() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (!source_) {
            return std::nullopt;
        }
        return source_->key;
    }

    Options configuration() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return options_;
    }

private:
    struct Source {
        std::string key;
        typename StrategyRegistry::Creator creator;
    };

    StrategyPtr current() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (!strategy_) {
            throw NoStrategySelectedError();
        }
        return strategy_;
    }

    // Held for the whole of a mutation, creator call included.
    std::mutex updateMutex_;
    mutable std::shared_mutex mutex_;
    StrategyPtr strategy_;
    std::optional<Source> source_;
    Options options_;
};

} // namespace core
} // namespace switchyard

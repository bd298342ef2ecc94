#pragma once

#include "switchyard/core/errors.h"
#include "switchyard/core/options.h"
#include "switchyard/utils/logging.hpp"
#include "switchyard/utils/result.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace switchyard {
namespace core {

/**
 * @brief Key to creator store that manufactures Interface instances on demand.
 *
 * The registry decouples which implementation to build from how it is built:
 * - creators receive the Options passed to create()
 * - re-registering a key replaces the previous creator (last write wins)
 * - listKeys() reports keys in first-registration order
 *
 * Registration takes an exclusive lock; lookups take a shared lock and run
 * the creator outside of it, so instances may be created concurrently.
 *
 * @tparam Interface the abstract type handed out by create()
 */
template <typename Interface>
class Registry {
public:
    using Creator = std::function<std::unique_ptr<Interface>(const Options&)>;
    using SimpleCreator = std::function<std::unique_ptr<Interface>()>;

    Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    /**
     * @brief Bind key to a creator that receives the configuration.
     *
     * @param key Non-empty lookup key
     * @param creator Function producing a new instance
     * @param description Optional human-readable description
     * @throws std::invalid_argument if key is empty or creator is empty
     */
    void registerCreator(const std::string& key, Creator creator,
                         const std::string& description = "") {
        if (key.empty()) {
            throw std::invalid_argument("registry key must not be empty");
        }
        if (!creator) {
            throw std::invalid_argument("creator for '" + key + "' must not be empty");
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            SWLOG_DEBUG("replacing creator for '" << key << "'");
            it->second = Entry{std::move(creator), description};
            return;
        }

        entries_.emplace(key, Entry{std::move(creator), description});
        order_.push_back(key);
        SWLOG_DEBUG("registered creator for '" << key << "'");
    }

    /**
     * @brief Bind key to a creator that takes no configuration.
     *
     * Options passed to create() are ignored for such keys.
     */
    void registerCreator(const std::string& key, SimpleCreator creator,
                         const std::string& description = "") {
        if (!creator) {
            throw std::invalid_argument("creator for '" + key + "' must not be empty");
        }
        registerCreator(
            key,
            Creator([creator = std::move(creator)](const Options&) { return creator(); }),
            description);
    }

    /**
     * @brief Bind key to Impl, constructed from Options when it accepts them.
     */
    template <typename Impl>
    void registerType(const std::string& key, const std::string& description = "") {
        static_assert(std::is_base_of<Interface, Impl>::value,
                      "Impl must derive from the registry interface");
        registerCreator(key, Creator([](const Options& options) -> std::unique_ptr<Interface> {
            if constexpr (std::is_constructible<Impl, const Options&>::value) {
                return std::make_unique<Impl>(options);
            } else {
                static_cast<void>(options);
                return std::make_unique<Impl>();
            }
        }), description);
    }

    /**
     * @brief Create a new instance for key.
     *
     * @throws UnknownKeyError if key is not registered
     * @throws ConstructionError if the creator throws or returns null
     */
    std::unique_ptr<Interface> create(const std::string& key,
                                      const Options& options = Options()) const {
        Creator creator = creatorFor(key);
        return construct(key, creator, options);
    }

    /**
     * @brief Non-throwing form of create().
     *
     * The error text is the message create() would have thrown.
     */
    Result<std::unique_ptr<Interface>> tryCreate(const std::string& key,
                                                 const Options& options = Options()) const {
        try {
            return create(key, options);
        } catch (const SwitchyardError& e) {
            return Result<std::unique_ptr<Interface>>(std::string(e.what()));
        }
    }

    /// Snapshot of registered keys in first-registration order.
    std::vector<std::string> listKeys() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return order_;
    }

    bool contains(const std::string& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.find(key) != entries_.end();
    }

    std::size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return order_.size();
    }

    /**
     * @throws UnknownKeyError if key is not registered
     */
    std::string description(const std::string& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return find(key).description;
    }

    /**
     * @brief Copy of the creator bound to key.
     * @throws UnknownKeyError if key is not registered
     */
    Creator creatorFor(const std::string& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return find(key).creator;
    }

    /**
     * @brief Run creator for key, translating its failures into ConstructionError.
     */
    static std::unique_ptr<Interface> construct(const std::string& key, const Creator& creator,
                                                const Options& options) {
        std::unique_ptr<Interface> instance;
        try {
            instance = creator(options);
        } catch (const std::exception& e) {
            SWLOG_ERROR("creator for '" << key << "' failed: " << e.what());
            throw ConstructionError(key, e.what(), std::current_exception());
        } catch (...) {
            SWLOG_ERROR("creator for '" << key << "' failed with a non-standard exception");
            throw ConstructionError(key, "non-standard exception", std::current_exception());
        }

        if (!instance) {
            SWLOG_ERROR("creator for '" << key << "' returned null");
            throw ConstructionError(key, "creator returned null");
        }
        return instance;
    }

private:
    struct Entry {
        Creator creator;
        std::string description;
    };

    // Caller holds mutex_.
    const Entry& find(const std::string& key) const {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            SWLOG_DEBUG("lookup of unregistered key '" << key << "'");
            throw UnknownKeyError(key);
        }
        return it->second;
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::vector<std::string> order_;
};

} // namespace core
} // namespace switchyard

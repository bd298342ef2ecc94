#pragma once

#include "switchyard/core/registry.h"
#include <type_traits>

namespace switchyard {
namespace core {

/**
 * @brief Helper object that registers an implementation when constructed.
 *
 * Usage:
 *   Registry<SortCapability> registry;
 *   Registrar<SortCapability, QuickSort> quick(registry, "quick", "Hoare quicksort");
 *
 * Impl is built from the Options given to create() when it has a
 * constructor taking const Options&, otherwise it is default constructed.
 *
 * @tparam Interface Registry interface type
 * @tparam Impl Concrete class (must inherit from Interface)
 */
template <typename Interface, typename Impl>
class Registrar {
    static_assert(std::is_base_of<Interface, Impl>::value,
        "Registered type must inherit from the registry interface");
    static_assert(std::is_constructible<Impl, const Options&>::value ||
                  std::is_default_constructible<Impl>::value,
        "Registered type must be constructible from Options or default constructible");

public:
    Registrar(Registry<Interface>& registry, const std::string& key,
              const std::string& description = "")
        : key_(key) {
        registry.template registerType<Impl>(key, description);
    }

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

} // namespace core
} // namespace switchyard

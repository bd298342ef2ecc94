#pragma once

#include <string>

namespace switchyard {
namespace core {

/**
 * @brief Abstract operation contract shared by all interchangeable variants.
 *
 * A variant implements perform() and reports a human-readable name. Variants
 * hold no shared mutable state; any configuration is captured when they are
 * constructed.
 *
 * @tparam Input  argument type of the operation
 * @tparam Output result type of the operation
 */
template <typename Input, typename Output>
class Capability {
public:
    using input_type = Input;
    using output_type = Output;

    virtual ~Capability() = default;

    virtual std::string name() const = 0;
    virtual Output perform(const Input& input) = 0;
};

/**
 * @brief Capability whose operation takes no argument.
 */
template <typename Output>
class Capability<void, Output> {
public:
    using input_type = void;
    using output_type = Output;

    virtual ~Capability() = default;

    virtual std::string name() const = 0;
    virtual Output perform() = 0;
};

} // namespace core
} // namespace switchyard

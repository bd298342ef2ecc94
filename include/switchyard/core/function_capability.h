#pragma once

#include "switchyard/core/capability.h"
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace switchyard {
namespace core {

/**
 * @brief Capability backed by a callable.
 *
 * Lets closures take part wherever a class-based variant is accepted. Any
 * configuration the callable needs is captured when the closure is built.
 */
template <typename Input, typename Output>
class FunctionCapability : public Capability<Input, Output> {
public:
    using Function = std::function<Output(const Input&)>;

    FunctionCapability(std::string name, Function function)
        : name_(std::move(name)), function_(std::move(function)) {
        if (!function_) {
            throw std::invalid_argument("function capability '" + name_ + "' has no callable");
        }
    }

    std::string name() const override { return name_; }
    Output perform(const Input& input) override { return function_(input); }

private:
    std::string name_;
    Function function_;
};

template <typename Output>
class FunctionCapability<void, Output> : public Capability<void, Output> {
public:
    using Function = std::function<Output()>;

    FunctionCapability(std::string name, Function function)
        : name_(std::move(name)), function_(std::move(function)) {
        if (!function_) {
            throw std::invalid_argument("function capability '" + name_ + "' has no callable");
        }
    }

    std::string name() const override { return name_; }
    Output perform() override { return function_(); }

private:
    std::string name_;
    Function function_;
};

template <typename Input, typename Output, typename Fn>
std::shared_ptr<Capability<Input, Output>> makeFunctionCapability(std::string name, Fn&& fn) {
    return std::make_shared<FunctionCapability<Input, Output>>(
        std::move(name),
        typename FunctionCapability<Input, Output>::Function(std::forward<Fn>(fn)));
}

} // namespace core
} // namespace switchyard

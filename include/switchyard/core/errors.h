#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace switchyard {
namespace core {

/**
 * @brief Base class for every error raised by the registry and context layer.
 */
class SwitchyardError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Raised when a key has no registered creator.
 */
class UnknownKeyError : public SwitchyardError {
public:
    explicit UnknownKeyError(const std::string& key);

    const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

/**
 * @brief Raised when a registered creator fails to produce an instance.
 *
 * The original exception is kept and can be rethrown with
 * std::rethrow_exception(cause()). A creator returning null has no cause.
 */
class ConstructionError : public SwitchyardError {
public:
    ConstructionError(const std::string& key, const std::string& reason,
                      std::exception_ptr cause = nullptr);

    const std::string& key() const noexcept { return key_; }
    std::exception_ptr cause() const noexcept { return cause_; }

private:
    std::string key_;
    std::exception_ptr cause_;
};

/**
 * @brief Raised when a Context is used before any strategy was selected.
 */
class NoStrategySelectedError : public SwitchyardError {
public:
    NoStrategySelectedError();
};

/**
 * @brief Raised for a missing, mistyped or out-of-range option, or an
 * unreadable configuration document.
 */
class ConfigurationError : public SwitchyardError {
public:
    ConfigurationError(const std::string& option, const std::string& reason);

    const std::string& option() const noexcept { return option_; }

private:
    std::string option_;
};

} // namespace core
} // namespace switchyard

#pragma once

#include "switchyard/core/errors.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>
#include <vector>

namespace switchyard {
namespace core {

/**
 * @brief Immutable bundle of named options handed to a variant at construction.
 *
 * Options are stored as a JSON object. Nothing mutates an Options value once it
 * exists; with() and merged() return new values. To change the configuration
 * of a variant, build a new variant with new Options.
 */
class Options {
public:
    Options();

    /**
     * @brief Wrap a JSON object. A null value yields empty Options.
     * @throws ConfigurationError if values is neither an object nor null
     */
    explicit Options(nlohmann::json values);

    /**
     * @brief Parse options from JSON text.
     * @throws ConfigurationError on malformed JSON or a non-object document
     */
    static Options fromJsonString(const std::string& text);

    /**
     * @brief Load options from a JSON file.
     * @throws ConfigurationError if the file cannot be opened or parsed
     */
    static Options fromFile(const std::string& path);

    bool has(const std::string& name) const;
    bool empty() const;
    std::size_t size() const;
    std::vector<std::string> names() const;

    /**
     * @brief Typed lookup with a fallback for absent options.
     * @throws ConfigurationError if the option exists with an incompatible type
     */
    template <typename T>
    T get(const std::string& name, const T& fallback) const {
        auto it = values_.find(name);
        if (it == values_.end()) {
            return fallback;
        }
        return convert<T>(name, *it);
    }

    /**
     * @brief Typed lookup of an option that must be present.
     * @throws ConfigurationError if the option is absent or has an incompatible type
     */
    template <typename T>
    T require(const std::string& name) const {
        auto it = values_.find(name);
        if (it == values_.end()) {
            throw ConfigurationError(name, "required option is missing");
        }
        return convert<T>(name, *it);
    }

    /// Copy with one option added or replaced.
    Options with(const std::string& name, nlohmann::json value) const;

    /// Copy with every option of overrides applied on top of this one.
    Options merged(const Options& overrides) const;

    /**
     * @brief The sub-object stored under name, as Options.
     *
     * Absent sections yield empty Options.
     * @throws ConfigurationError if the option exists but is not an object
     */
    Options section(const std::string& name) const;

    const nlohmann::json& values() const { return values_; }
    std::string dump() const;

    bool operator==(const Options& other) const { return values_ == other.values_; }
    bool operator!=(const Options& other) const { return !(*this == other); }

private:
    // Booleans, integers, floats and strings must match the stored JSON kind
    // exactly; nlohmann would otherwise convert between them silently.
    template <typename T>
    static T convert(const std::string& name, const nlohmann::json& value) {
        if constexpr (std::is_same<T, bool>::value) {
            if (!value.is_boolean()) {
                throw typeMismatch(name, "boolean", value);
            }
            return value.get<bool>();
        } else if constexpr (std::is_integral<T>::value) {
            if (!value.is_number_integer()) {
                throw typeMismatch(name, "integer", value);
            }
            return toIntegral<T>(name, value);
        } else if constexpr (std::is_floating_point<T>::value) {
            if (!value.is_number()) {
                throw typeMismatch(name, "number", value);
            }
            return value.get<T>();
        } else if constexpr (std::is_same<T, std::string>::value) {
            if (!value.is_string()) {
                throw typeMismatch(name, "string", value);
            }
            return value.get<std::string>();
        } else {
            try {
                return value.get<T>();
            } catch (const nlohmann::json::exception& e) {
                throw ConfigurationError(name, std::string("unexpected type: ") + e.what());
            }
        }
    }

    template <typename T>
    static T toIntegral(const std::string& name, const nlohmann::json& value) {
        using Limits = std::numeric_limits<T>;
        if (value.is_number_unsigned()) {
            const auto unsignedValue = value.get<std::uint64_t>();
            if (unsignedValue > static_cast<std::uint64_t>(Limits::max())) {
                throw outOfRange(name, value);
            }
            return static_cast<T>(unsignedValue);
        }

        const auto signedValue = value.get<std::int64_t>();
        if (signedValue < 0) {
            if constexpr (std::is_unsigned<T>::value) {
                throw outOfRange(name, value);
            } else if (signedValue < static_cast<std::int64_t>(Limits::min())) {
                throw outOfRange(name, value);
            }
        } else if (static_cast<std::uint64_t>(signedValue) >
                   static_cast<std::uint64_t>(Limits::max())) {
            throw outOfRange(name, value);
        }
        return static_cast<T>(signedValue);
    }

    static ConfigurationError typeMismatch(const std::string& name, const char* expected,
                                           const nlohmann::json& value);
    static ConfigurationError outOfRange(const std::string& name, const nlohmann::json& value);

    nlohmann::json values_;
};

} // namespace core
} // namespace switchyard

#include "switchyard/core/options.h"
#include <fstream>

namespace switchyard {
namespace core {

Options::Options() : values_(nlohmann::json::object()) {}

Options::Options(nlohmann::json values) : values_(std::move(values)) {
    if (values_.is_null()) {
        values_ = nlohmann::json::object();
    }
    if (!values_.is_object()) {
        throw ConfigurationError("", "options must be a JSON object, got " +
                                         std::string(values_.type_name()));
    }
}

Options Options::fromJsonString(const std::string& text) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("", std::string("malformed JSON: ") + e.what());
    }
    return Options(std::move(parsed));
}

Options Options::fromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("", "cannot open configuration file '" + path + "'");
    }

    nlohmann::json parsed;
    try {
        in >> parsed;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("", "malformed JSON in '" + path + "': " + e.what());
    }
    return Options(std::move(parsed));
}

bool Options::has(const std::string& name) const {
    return values_.contains(name);
}

bool Options::empty() const {
    return values_.empty();
}

std::size_t Options::size() const {
    return values_.size();
}

std::vector<std::string> Options::names() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (auto it = values_.begin(); it != values_.end(); ++it) {
        result.push_back(it.key());
    }
    return result;
}

Options Options::with(const std::string& name, nlohmann::json value) const {
    nlohmann::json copy = values_;
    copy[name] = std::move(value);
    return Options(std::move(copy));
}

Options Options::merged(const Options& overrides) const {
    nlohmann::json copy = values_;
    copy.update(overrides.values_);
    return Options(std::move(copy));
}

Options Options::section(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        return Options();
    }
    if (!it->is_object()) {
        throw ConfigurationError(name, "expected an object section");
    }
    return Options(*it);
}

std::string Options::dump() const {
    return values_.dump();
}

ConfigurationError Options::typeMismatch(const std::string& name, const char* expected,
                                         const nlohmann::json& value) {
    return ConfigurationError(name, std::string("expected ") + expected + ", got " +
                                        value.type_name() + " " + value.dump());
}

ConfigurationError Options::outOfRange(const std::string& name, const nlohmann::json& value) {
    return ConfigurationError(name, "value " + value.dump() + " is out of range");
}

} // namespace core
} // namespace switchyard

#include "switchyard/core/errors.h"

namespace switchyard {
namespace core {

UnknownKeyError::UnknownKeyError(const std::string& key)
    : SwitchyardError("unknown key: '" + key + "'"), key_(key) {}

ConstructionError::ConstructionError(const std::string& key, const std::string& reason,
                                     std::exception_ptr cause)
    : SwitchyardError("failed to construct '" + key + "': " + reason),
      key_(key),
      cause_(std::move(cause)) {}

NoStrategySelectedError::NoStrategySelectedError()
    : SwitchyardError("no strategy selected") {}

ConfigurationError::ConfigurationError(const std::string& option, const std::string& reason)
    : SwitchyardError(option.empty() ? reason : "option '" + option + "': " + reason),
      option_(option) {}

} // namespace core
} // namespace switchyard

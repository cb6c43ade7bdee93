#pragma once
/** @file  ProtocolFactory.hpp
 *  @brief Runtime registry that maps calibration protocol names to creators.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace flowcal::protocols {
  class CalibrationProtocol;
}

namespace flowcal::core {

  /**
 * @class ProtocolFactory
 * @brief Register & instantiate protocol objects by string key.
 *
 *  * Keeps TestCoordinator decoupled from concrete protocols.
 *  * Creators are lambdas returning `unique_ptr<CalibrationProtocol>`.
 */
  class ProtocolFactory {
  public:
    using Creator = std::function<std::unique_ptr<protocols::CalibrationProtocol>()>;

    /// Factory with "FlowSweep" registered.
    static std::shared_ptr<ProtocolFactory> withBuiltins();

    /// Register a protocol under \p name.  Returns false on duplicate.
    bool registerProtocol(const std::string& name, Creator maker);

    /// Create a fresh instance or throw ConfigurationError if unknown.
    std::unique_ptr<protocols::CalibrationProtocol> create(const std::string& name) const;

    bool knows(const std::string& name) const { return creators_.count(name) != 0; }

  private:
    std::unordered_map<std::string, Creator> creators_;
  };

} // namespace flowcal::core

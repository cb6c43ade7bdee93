#pragma once
/** @file  DeviceFactory.hpp
 *  @brief Runtime registry that maps instrument model names to driver creators.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/Settings.hpp"

namespace flowcal::devices {
  class Instrument;
}

namespace flowcal::core {

  /**
 * @class DeviceFactory
 * @brief Register & instantiate instrument drivers by model name.
 *
 *  * Keeps Equipment and TestCoordinator decoupled from concrete drivers.
 *  * Creators receive the instrument's bench settings.
 */
  class DeviceFactory {
  public:
    using Creator =
        std::function<std::unique_ptr<devices::Instrument>(const InstrumentSetting& setting)>;

    /// Factory pre-loaded with "ColeParmerMFC", "GPDX303S" and "Keysight34972A".
    static std::shared_ptr<DeviceFactory> withBuiltins();

    /// Register a driver under \p model.  Returns false on duplicate.
    bool registerModel(const std::string& model, Creator maker);

    /// Create a fresh driver or throw ConfigurationError if the model is unknown.
    std::unique_ptr<devices::Instrument> create(const InstrumentSetting& setting) const;

    /// One driver per configured instrument, in configuration order.
    std::vector<std::unique_ptr<devices::Instrument>>
    createAll(const std::vector<InstrumentSetting>& settings) const;

    bool knows(const std::string& model) const { return creators_.count(model) != 0; }

  private:
    std::unordered_map<std::string, Creator> creators_;
  };

} // namespace flowcal::core

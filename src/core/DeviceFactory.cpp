/* @file DeviceFactory.cpp
 * @brief Model-name registry plus the built-in serial drivers.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// FlowCal headers
#include "core/DeviceFactory.hpp"
#include "core/Errors.hpp"
#include "devices/ColeParmerMFC.hpp"
#include "devices/GPDX303S.hpp"
#include "devices/Keysight34972A.hpp"

using namespace flowcal::core;
using namespace flowcal::devices;

std::shared_ptr<DeviceFactory> DeviceFactory::withBuiltins() {
  auto factory = std::make_shared<DeviceFactory>();

  factory->registerModel("ColeParmerMFC", [](const InstrumentSetting& s) {
    ColeParmerMFC::Options options;
    options.echoTolerance = s.echoTolerance.value_or(ColeParmerMFC::kDefaultEchoTolerance);
    options.allowOpenValveMeasure = s.allowOpenValveMeasure;
    options.openValveSetpoint = s.openValveSetpoint;
    return std::make_unique<ColeParmerMFC>(
        std::make_unique<io::SerialChannel>(),
        s.serial.applyTo(ColeParmerMFC::defaultSettings(s.serial.port)), options);
  });

  factory->registerModel("GPDX303S", [](const InstrumentSetting& s) {
    GPDX303S::Options options;
    options.channel = s.channel;
    options.echoTolerance = s.echoTolerance.value_or(GPDX303S::kDefaultEchoTolerance);
    return std::make_unique<GPDX303S>(std::make_unique<io::SerialChannel>(),
                                      s.serial.applyTo(GPDX303S::defaultSettings(s.serial.port)),
                                      options);
  });

  factory->registerModel("Keysight34972A", [](const InstrumentSetting& s) {
    return std::make_unique<Keysight34972A>(
        std::make_unique<io::SerialChannel>(),
        s.serial.applyTo(Keysight34972A::defaultSettings(s.serial.port)));
  });

  return factory;
}

bool DeviceFactory::registerModel(const std::string& model, Creator maker) {
  return creators_.emplace(model, std::move(maker)).second;
}

std::unique_ptr<Instrument> DeviceFactory::create(const InstrumentSetting& setting) const {
  auto it = creators_.find(setting.model);
  if (it == creators_.end()) {
    throw ConfigurationError("Equipment model \"" + setting.model +
                             "\" not found. Please contact Engineering.");
  }
  return it->second(setting);
}

std::vector<std::unique_ptr<Instrument>>
DeviceFactory::createAll(const std::vector<InstrumentSetting>& settings) const {
  std::vector<std::unique_ptr<Instrument>> instruments;
  instruments.reserve(settings.size());
  for (const auto& setting : settings)
    instruments.push_back(create(setting));
  return instruments;
}

/* @file ProtocolFactory.cpp
 * @brief Protocol-name registry.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/ProtocolFactory.hpp"
#include "core/Errors.hpp"
#include "protocols/FlowCalibration.hpp"

using namespace flowcal::core;

std::shared_ptr<ProtocolFactory> ProtocolFactory::withBuiltins() {
  auto factory = std::make_shared<ProtocolFactory>();
  factory->registerProtocol("FlowSweep",
                            [] { return std::make_unique<protocols::FlowCalibration>(); });
  return factory;
}

bool ProtocolFactory::registerProtocol(const std::string& name, Creator maker) {
  return creators_.emplace(name, std::move(maker)).second;
}

std::unique_ptr<flowcal::protocols::CalibrationProtocol>
ProtocolFactory::create(const std::string& name) const {
  auto it = creators_.find(name);
  if (it == creators_.end())
    throw ConfigurationError("Test protocol \"" + name + "\" not found. Please contact Engineering.");
  return it->second();
}

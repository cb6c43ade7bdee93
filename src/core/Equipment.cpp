/* @file Equipment.cpp
 * @brief Capability binding, scoped open/close and all-or-nothing polling.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <iostream>

// FlowCal headers
#include "core/Equipment.hpp"
#include "core/Errors.hpp"

using namespace flowcal::core;
using flowcal::devices::VariableType;

double Snapshot::value(VariableType kind) const {
  auto it = byReference.find(kind);
  if (it == byReference.end()) {
    throw ConfigurationError(std::string("No reference instrument provides ") +
                             devices::toString(kind) + ".");
  }
  return it->second.at(kind);
}

Equipment::Equipment(std::vector<std::unique_ptr<devices::Instrument>> instruments)
    : instruments_(std::move(instruments)) {

  for (auto& instrument : instruments_) {
    if (!instrument)
      throw std::invalid_argument("[Equipment] instrument is nullptr");

    for (auto type : devices::kAllVariableTypes) {
      if (provides(type))
        continue;
      if (auto* ref = devices::asReference(*instrument, type))
        references_.emplace_back(type, ref);
    }

    for (auto type : devices::kAllVariableTypes) {
      auto* ctl = devices::asController(*instrument, type);
      if (ctl && std::find(controllers_.begin(), controllers_.end(), ctl) == controllers_.end())
        controllers_.push_back(ctl);
    }

    if (auto* gas = dynamic_cast<devices::GasSelectable*>(instrument.get()))
      gasSelectable_.push_back(gas);

    if (!massFlowController_)
      massFlowController_ = dynamic_cast<devices::MassFlowController*>(instrument.get());
    if (!massFlowReference_)
      massFlowReference_ = dynamic_cast<devices::MassFlowReference*>(instrument.get());
    if (!dutInterface_)
      dutInterface_ = dynamic_cast<devices::DutInterfaceDevice*>(instrument.get());
    if (!supply_)
      supply_ = dynamic_cast<devices::VoltageController*>(instrument.get());
  }
}

Equipment::~Equipment() {
  for (const auto& err : close())
    std::cerr << "[Equipment] " << err << "\n";
}

// configuration order; the first failure propagates and earlier instruments stay open
void Equipment::open() {
  for (auto& instrument : instruments_)
    instrument->open();
}

std::vector<std::string> Equipment::close() {
  std::vector<std::string> errors;
  for (auto& instrument : instruments_) {
    try {
      instrument->close();
    } catch (const std::exception& e) {
      errors.push_back("Could not close " + instrument->model() + ": " + e.what());
    }
  }
  return errors;
}

Snapshot Equipment::read() {
  std::unordered_map<devices::ReferenceDevice*, devices::Reading> polled;
  Snapshot snapshot;

  for (auto& [kind, device] : references_) {
    auto it = polled.find(device);
    if (it == polled.end())
      it = polled.emplace(device, device->read()).first;

    if (it->second.find(kind) == it->second.end()) {
      throw CommunicationError(std::string("Reference instrument did not report ") +
                               devices::toString(kind) + ".");
    }
    snapshot.byReference[kind] = it->second;
  }
  return snapshot;
}

void Equipment::selectGas(protocols::Gas gas) {
  for (auto* device : gasSelectable_)
    device->setGas(gas);
}

flowcal::devices::MassFlowController& Equipment::massFlowController() const {
  if (!massFlowController_)
    throw ConfigurationError("No instrument in the equipment list can control mass flow.");
  return *massFlowController_;
}

flowcal::devices::MassFlowReference& Equipment::massFlowReference() const {
  if (!massFlowReference_)
    throw ConfigurationError("No instrument in the equipment list can measure mass flow.");
  return *massFlowReference_;
}

flowcal::devices::DutInterfaceDevice& Equipment::dutInterface() const {
  if (!dutInterface_)
    throw ConfigurationError("No instrument in the equipment list can read DUT outputs.");
  return *dutInterface_;
}

std::vector<flowcal::devices::ControlDevice*> Equipment::controllers() const {
  return controllers_;
}

bool Equipment::provides(VariableType reference) const {
  return std::any_of(references_.begin(), references_.end(),
                     [&](const auto& entry) { return entry.first == reference; });
}

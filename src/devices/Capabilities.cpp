/* @file Capabilities.cpp
 * @brief Cross-cast helpers that map a VariableType onto its capability interface.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "devices/Capabilities.hpp"

namespace flowcal::devices {

  namespace {
    template <VariableType V> ReferenceDevice* referenceAs(Instrument& instrument) {
      return dynamic_cast<Reference<V>*>(&instrument);
    }

    template <VariableType V> ControlDevice* controllerAs(Instrument& instrument) {
      return dynamic_cast<Controller<V>*>(&instrument);
    }
  } // namespace

  ReferenceDevice* asReference(Instrument& instrument, VariableType type) {
    switch (type) {
    case VariableType::MassFlow:
      return referenceAs<VariableType::MassFlow>(instrument);
    case VariableType::VolumeFlow:
      return referenceAs<VariableType::VolumeFlow>(instrument);
    case VariableType::Velocity:
      return referenceAs<VariableType::Velocity>(instrument);
    case VariableType::Pressure:
      return referenceAs<VariableType::Pressure>(instrument);
    case VariableType::Temperature:
      return referenceAs<VariableType::Temperature>(instrument);
    case VariableType::Voltage:
      return referenceAs<VariableType::Voltage>(instrument);
    case VariableType::Current:
      return referenceAs<VariableType::Current>(instrument);
    case VariableType::Count:
      break;
    }
    return nullptr;
  }

  ControlDevice* asController(Instrument& instrument, VariableType type) {
    switch (type) {
    case VariableType::MassFlow:
      return controllerAs<VariableType::MassFlow>(instrument);
    case VariableType::VolumeFlow:
      return controllerAs<VariableType::VolumeFlow>(instrument);
    case VariableType::Velocity:
      return controllerAs<VariableType::Velocity>(instrument);
    case VariableType::Pressure:
      return controllerAs<VariableType::Pressure>(instrument);
    case VariableType::Temperature:
      return controllerAs<VariableType::Temperature>(instrument);
    case VariableType::Voltage:
      return controllerAs<VariableType::Voltage>(instrument);
    case VariableType::Current:
      return controllerAs<VariableType::Current>(instrument);
    case VariableType::Count:
      break;
    }
    return nullptr;
  }

} // namespace flowcal::devices

#pragma once
/** @file  Types.hpp
 *  @brief Measurement vocabulary shared by drivers, equipment and protocols.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstdint>
#include <unordered_map>

namespace flowcal {
  namespace devices {

    enum class VariableType : std::uint8_t {
      MassFlow,
      VolumeFlow,
      Velocity,
      Pressure,
      Temperature,
      Voltage,
      Current,
      Count
    };
    static_assert(static_cast<std::uint8_t>(VariableType::Count) == 7,
                  "VariableType count changed please update code that depends on it");

    inline constexpr std::array<VariableType, 7> kAllVariableTypes{
      VariableType::MassFlow,    VariableType::VolumeFlow, VariableType::Velocity,
      VariableType::Pressure,    VariableType::Temperature, VariableType::Voltage,
      VariableType::Current
    };

    inline const char* toString(VariableType t) {
      switch (t) {
      case VariableType::MassFlow:
        return "MassFlow";
      case VariableType::VolumeFlow:
        return "VolumeFlow";
      case VariableType::Velocity:
        return "Velocity";
      case VariableType::Pressure:
        return "Pressure";
      case VariableType::Temperature:
        return "Temperature";
      case VariableType::Voltage:
        return "Voltage";
      case VariableType::Current:
        return "Current";
      case VariableType::Count:
        break;
      }
      return "Unknown";
    }

    /// Passive = output off / zero, Active = regulate to setpoint, Measure = read-only.
    enum class ControlMode { Passive, Active, Measure };

    inline const char* toString(ControlMode m) {
      switch (m) {
      case ControlMode::Passive:
        return "Passive";
      case ControlMode::Active:
        return "Active";
      case ControlMode::Measure:
        return "Measure";
      }
      return "Unknown";
    }

    /// One poll worth of values; an instrument fills only what it measures.
    using Reading = std::unordered_map<VariableType, double>;

  } // namespace devices
} // namespace flowcal

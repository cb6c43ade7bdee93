#pragma once
/** @file  Dut.hpp
 *  @brief One device under test for the lifetime of a single run.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <string>

// FlowCal headers
#include "core/Settings.hpp"

namespace flowcal::core {

  enum class DutStatus : std::uint8_t { Init, Found, NotFound, Pass, Fail, PortError };

  inline const char* toString(DutStatus s) {
    switch (s) {
    case DutStatus::Init:
      return "Init";
    case DutStatus::Found:
      return "Found";
    case DutStatus::NotFound:
      return "Not Found";
    case DutStatus::Pass:
      return "Pass";
    case DutStatus::Fail:
      return "Fail";
    case DutStatus::PortError:
      return "Port Error";
    }
    return "Unknown";
  }

  /**
 * @struct Dut
 * @brief Built fresh from the configuration snapshot when a run starts and
 *        discarded when it ends; never reused across runs.
 */
  struct Dut {
    unsigned index{ 0 }; ///< 1-based, stable for the run
    std::string serialNumber;
    bool selected{ false };
    DutStatus status{ DutStatus::Init };
    std::string message;
    ModelSetting model;

    /// Analog output (volts) → flow in the range's units.
    double toFlow(double volts, const RangeSetting& range) const {
      const double span = model.outputMax - model.outputMin;
      return range.min + (volts - model.outputMin) / span * (range.max - range.min);
    }

    bool isPresent(double volts) const { return volts >= model.presenceThreshold; }
  };

} // namespace flowcal::core

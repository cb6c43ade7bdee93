#pragma once
/** @file  GpdScpi.hpp
 *  @brief SCPI-style command set of the GW Instek GPD-X303S power supply.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

// FlowCal headers
#include "protocols/Command.hpp"

namespace flowcal::protocols::gpd {

  Command setVoltage(unsigned channel, double volts); ///< "VSET1:5.000"
  Command setCurrent(unsigned channel, double amps);  ///< "ISET1:1.000"
  Command queryVoltageSetpoint(unsigned channel);     ///< "VSET1?"
  Command queryCurrentSetpoint(unsigned channel);     ///< "ISET1?"
  Command queryVoltage(unsigned channel);             ///< "VOUT1?"
  Command queryCurrent(unsigned channel);             ///< "IOUT1?"
  Command output(bool on);                            ///< "OUT1" / "OUT0"

  /// Last token of the reply with any trailing unit letter (V, A) removed, e.g. "5.000V" → 5.0.
  double parseValue(const std::string& line);

} // namespace flowcal::protocols::gpd

#pragma once
/** @file  KeysightScpi.hpp
 *  @brief SCPI subset used to read DUT outputs on a Keysight 34972A datalogger.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

// FlowCal headers
#include "protocols/Command.hpp"

namespace flowcal::protocols::keysight {

  Command identify();                       ///< "*IDN?"
  Command measureVoltage(unsigned channel); ///< "MEAS:VOLT:DC? AUTO,DEF,(@101)"

  /// True when an *IDN? reply names a 34970A/34972A mainframe.
  bool isSupportedIdentity(const std::string& line);

  /// Exactly one numeric token, e.g. "+1.23456789E+00".
  double parseMeasurement(const std::string& line);

  /// Slot 1-3, channel 01-20 (101..120, 201..220, 301..320).
  bool isValidChannel(unsigned channel);

} // namespace flowcal::protocols::keysight

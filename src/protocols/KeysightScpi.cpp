/* @file KeysightScpi.cpp
 * @brief Keysight 34972A command rendering and reply parsing.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// FlowCal headers
#include "protocols/KeysightScpi.hpp"
#include "core/Errors.hpp"
#include "protocols/Response.hpp"

namespace flowcal::protocols::keysight {

  Command identify() { return Command::query("*IDN?"); }

  Command measureVoltage(unsigned channel) {
    return Command::query("MEAS:VOLT:DC? AUTO,DEF,(@" + std::to_string(channel) + ")");
  }

  bool isSupportedIdentity(const std::string& line) {
    return line.find("34972A") != std::string::npos || line.find("34970A") != std::string::npos;
  }

  double parseMeasurement(const std::string& line) {
    auto response = Response::fromWire(line);
    if (!response)
      throw core::UnexpectedResponseError("empty reply from datalogger");
    if (response->size() != 1) {
      throw core::UnexpectedResponseError("datalogger reply \"" + response->raw +
                                          "\" holds more than one reading");
    }
    return response->number(0);
  }

  bool isValidChannel(unsigned channel) {
    const unsigned slot = channel / 100;
    const unsigned index = channel % 100;
    return slot >= 1 && slot <= 3 && index >= 1 && index <= 20;
  }

} // namespace flowcal::protocols::keysight

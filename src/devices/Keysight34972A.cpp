/* @file Keysight34972A.cpp
 * @brief Keysight 34972A datalogger driver.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <utility>

// FlowCal headers
#include "core/Errors.hpp"
#include "devices/Keysight34972A.hpp"
#include "protocols/KeysightScpi.hpp"

using namespace flowcal::devices;
using namespace flowcal::core;
namespace ks = flowcal::protocols::keysight;

flowcal::io::SerialSettings Keysight34972A::defaultSettings(std::string port) {
  io::SerialSettings s;
  s.port = std::move(port);
  s.baudRate = kDefaultBaud;
  s.readTimeout = std::chrono::milliseconds{ 2000 }; // autorange DC volts can take a while
  s.lineTerminator = "\n";
  return s;
}

Keysight34972A::Keysight34972A(std::unique_ptr<io::SerialChannel> channel,
                               io::SerialSettings settings)
    : SerialDevice(std::move(channel), std::move(settings)) {}

void Keysight34972A::validate(const io::SerialSettings& s) const {
  requireBaud(s.baudRate, { 1200, 2400, 4800, 9600, 19200, 38400, 57600, 115200 });
  // 8N1, 7E1 and 7O1 are the only frames the RS-232 menu offers
  if (s.dataBits == 8)
    requireFraming(s, { 8 }, { io::Parity::None }, { io::StopBits::One });
  else
    requireFraming(s, { 7 }, { io::Parity::Even, io::Parity::Odd }, { io::StopBits::One });
}

void Keysight34972A::onOpened() {
  auto reply = query(ks::identify());
  if (!ks::isSupportedIdentity(reply))
    throw UnexpectedResponseError("Instrument on " + settings().port +
                                  " is not a 34972A datalogger: \"" + reply + "\"");
  identity_ = reply;
}

double Keysight34972A::readChannel(unsigned channel) {
  if (!ks::isValidChannel(channel)) {
    throw OutOfRangeError("Datalogger channel " + std::to_string(channel) +
                          " does not exist (slots 1-3, channels 01-20).");
  }
  return ks::parseMeasurement(query(ks::measureVoltage(channel)));
}

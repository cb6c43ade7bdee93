/* @file SerialDevice.cpp
 * @brief Shared open/close/exchange logic for serial instruments.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cassert>
#include <utility>

// FlowCal headers
#include "core/Errors.hpp"
#include "devices/SerialDevice.hpp"

using namespace flowcal::devices;
using namespace flowcal::core;

namespace {

  const char* parityName(flowcal::io::Parity p) {
    switch (p) {
    case flowcal::io::Parity::None:
      return "no";
    case flowcal::io::Parity::Even:
      return "even";
    case flowcal::io::Parity::Odd:
      return "odd";
    }
    return "unknown";
  }

} // namespace

SerialDevice::SerialDevice(std::unique_ptr<io::SerialChannel> channel, io::SerialSettings settings)
    : channel_(std::move(channel)), settings_(std::move(settings)) {
  assert(channel_ && "[SerialDevice] serial channel is nullptr");
}

// derived close() overrides have already run by now; this only releases the port
SerialDevice::~SerialDevice() {
  if (channel_)
    channel_->close();
}

void SerialDevice::configure(const io::SerialSettings& settings) {
  validate(settings);
  settings_ = settings;
}

void SerialDevice::open() {
  // never let an unsupported setting reach the transport
  validate(settings_);

  if (!channel_->open(settings_)) {
    throw PortUnavailableError("Could not open " + model() + " serial port \"" + settings_.port +
                               "\" (" + io::toString(channel_->lastError()) + ")");
  }

  try {
    onOpened();
  } catch (...) {
    channel_->close();
    throw;
  }
}

void SerialDevice::close() { channel_->close(); }

bool SerialDevice::isOpen() const { return channel_->isOpen(); }

void SerialDevice::send(const protocols::Command& cmd) {
  if (!channel_->isOpen())
    throw CommunicationError(model() + " serial port is not open");

  if (!channel_->writeLine(cmd.toWire())) {
    if (channel_->lastError() == io::ChannelError::Timeout)
      throw TimeoutError("Timed out writing \"" + cmd.payload + "\" to " + model());
    throw CommunicationError("Could not write \"" + cmd.payload + "\" to " + model() + " (" +
                             io::toString(channel_->lastError()) + ")");
  }
}

std::string SerialDevice::query(const protocols::Command& cmd) {
  send(cmd);

  auto line = channel_->readLine(settings_.readTimeout);
  if (!line) {
    if (channel_->lastError() == io::ChannelError::Timeout)
      throw TimeoutError("No response from " + model() + " to \"" + cmd.payload + "\"");
    throw CommunicationError("Lost " + model() + " while waiting for \"" + cmd.payload + "\" (" +
                             io::toString(channel_->lastError()) + ")");
  }
  return *line;
}

void SerialDevice::requireBaud(int baud, std::initializer_list<int> supported) const {
  if (std::find(supported.begin(), supported.end(), baud) == supported.end()) {
    throw UnsupportedSettingError("The " + model() + " does not support baud rate " +
                                  std::to_string(baud) + ".");
  }
}

void SerialDevice::requireFraming(const io::SerialSettings& s, std::initializer_list<int> dataBits,
                                  std::initializer_list<io::Parity> parities,
                                  std::initializer_list<io::StopBits> stopBits) const {
  if (std::find(dataBits.begin(), dataBits.end(), s.dataBits) == dataBits.end()) {
    throw UnsupportedSettingError("The " + model() + " does not support " +
                                  std::to_string(s.dataBits) + " data bits.");
  }
  if (std::find(parities.begin(), parities.end(), s.parity) == parities.end()) {
    throw UnsupportedSettingError("The " + model() + " does not support " + parityName(s.parity) +
                                  " parity.");
  }
  if (std::find(stopBits.begin(), stopBits.end(), s.stopBits) == stopBits.end()) {
    throw UnsupportedSettingError("The " + model() + " does not support " +
                                  (s.stopBits == io::StopBits::Two ? "two" : "one") +
                                  " stop bit(s).");
  }
}

/* @file GPDX303S.cpp
 * @brief GPD-X303S driver.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cmath>
#include <utility>

// FlowCal headers
#include "core/Errors.hpp"
#include "devices/GPDX303S.hpp"
#include "protocols/GpdScpi.hpp"
#include "protocols/Response.hpp"

using namespace flowcal::devices;
using namespace flowcal::core;
namespace gpd = flowcal::protocols::gpd;

flowcal::io::SerialSettings GPDX303S::defaultSettings(std::string port) {
  io::SerialSettings s;
  s.port = std::move(port);
  s.baudRate = kDefaultBaud;
  s.lineTerminator = "\n";
  return s;
}

GPDX303S::GPDX303S(std::unique_ptr<io::SerialChannel> channel, io::SerialSettings settings,
                   Options options)
    : SerialDevice(std::move(channel), std::move(settings)), options_(options) {
  if (options_.channel < 1 || options_.channel > 2) {
    throw UnsupportedSettingError("GPD-X303S has no programmable output channel " +
                                  std::to_string(options_.channel) + ".");
  }
}

GPDX303S::GPDX303S(std::unique_ptr<io::SerialChannel> channel, io::SerialSettings settings)
    : GPDX303S(std::move(channel), std::move(settings), Options{}) {}

void GPDX303S::validate(const io::SerialSettings& s) const {
  requireBaud(s.baudRate, { 9600, 57600, 115200 });
  requireFraming(s, { 8 }, { io::Parity::None }, { io::StopBits::One });
}

double GPDX303S::queryValue(const protocols::Command& cmd) { return gpd::parseValue(query(cmd)); }

Reading GPDX303S::read() {
  const double volts = queryValue(gpd::queryVoltage(options_.channel));
  const double amps = queryValue(gpd::queryCurrent(options_.channel));
  return Reading{ { VariableType::Voltage, volts }, { VariableType::Current, amps } };
}

void GPDX303S::writeSetpoint(VariableType type, double value) {
  double limit = 0.0;
  protocols::Command set;
  protocols::Command readBack;

  switch (type) {
  case VariableType::Voltage:
    limit = kMaxVoltage;
    set = gpd::setVoltage(options_.channel, value);
    readBack = gpd::queryVoltageSetpoint(options_.channel);
    break;
  case VariableType::Current:
    limit = kMaxCurrent;
    set = gpd::setCurrent(options_.channel, value);
    readBack = gpd::queryCurrentSetpoint(options_.channel);
    break;
  case VariableType::MassFlow:
  case VariableType::VolumeFlow:
  case VariableType::Velocity:
  case VariableType::Pressure:
  case VariableType::Temperature:
  case VariableType::Count:
    throw UnsupportedSettingError(std::string("Power supply does not support ") + toString(type) +
                                  " setpoints.");
  }

  if (!std::isfinite(value) || value < 0.0 || value > limit) {
    throw OutOfRangeError(std::string(toString(type)) + " setpoint must be within 0 and " +
                          protocols::formatFixed(limit, 1) + ".");
  }

  send(set);
  const double echoed = queryValue(readBack);
  if (std::fabs(echoed - value) > options_.echoTolerance) {
    throw CommunicationError("Could not write " + std::string(toString(type)) + " setpoint (" +
                             protocols::formatFixed(value, 3) + ") to power supply. Value read back (" +
                             protocols::formatFixed(echoed, 3) + ") was incorrect.");
  }
}

double GPDX303S::readSetpoint(VariableType type) {
  switch (type) {
  case VariableType::Voltage:
    return queryValue(gpd::queryVoltageSetpoint(options_.channel));
  case VariableType::Current:
    return queryValue(gpd::queryCurrentSetpoint(options_.channel));
  case VariableType::MassFlow:
  case VariableType::VolumeFlow:
  case VariableType::Velocity:
  case VariableType::Pressure:
  case VariableType::Temperature:
  case VariableType::Count:
    break;
  }
  throw UnsupportedSettingError(std::string("Power supply does not support ") + toString(type) +
                                " setpoints.");
}

void GPDX303S::setControlMode(ControlMode mode) {
  switch (mode) {
  case ControlMode::Passive:
    send(gpd::output(false));
    break;
  case ControlMode::Active:
    send(gpd::output(true));
    break;
  case ControlMode::Measure:
    throw UnsupportedSettingError(
        "Power supply does not support measure mode. Do you need a multimeter instead?");
  }
}

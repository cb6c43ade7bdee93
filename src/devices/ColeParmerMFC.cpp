/* @file ColeParmerMFC.cpp
 * @brief Cole-Parmer MFC driver: polling, setpoint echo checks and gas selection.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cmath>
#include <utility>

// FlowCal headers
#include "core/Errors.hpp"
#include "devices/ColeParmerMFC.hpp"
#include "protocols/ColeParmerProtocol.hpp"
#include "protocols/Response.hpp"

using namespace flowcal::devices;
using namespace flowcal::core;
namespace cp = flowcal::protocols::coleparmer;

flowcal::io::SerialSettings ColeParmerMFC::defaultSettings(std::string port) {
  io::SerialSettings s;
  s.port = std::move(port);
  s.baudRate = kDefaultBaud;
  s.dataBits = 8;
  s.parity = io::Parity::None;
  s.stopBits = io::StopBits::One;
  s.readTimeout = std::chrono::milliseconds{ 500 };
  s.writeTimeout = std::chrono::milliseconds{ 500 };
  s.lineTerminator = "\r";
  return s;
}

ColeParmerMFC::ColeParmerMFC(std::unique_ptr<io::SerialChannel> channel,
                             io::SerialSettings settings, Options options)
    : SerialDevice(std::move(channel), std::move(settings)), options_(options) {}

ColeParmerMFC::ColeParmerMFC(std::unique_ptr<io::SerialChannel> channel,
                             io::SerialSettings settings)
    : ColeParmerMFC(std::move(channel), std::move(settings), Options{}) {}

void ColeParmerMFC::validate(const io::SerialSettings& s) const {
  requireBaud(s.baudRate, { 2400, 9600, 19200, 38400, 57600 });
  requireFraming(s, { 8 }, { io::Parity::None }, { io::StopBits::One });
}

// "*@=A" assigns the address and switches the unit to polling mode
void ColeParmerMFC::onOpened() {
  auto frame = cp::parseFrame(query(cp::assignAddress()));
  lastEcho_ = frame.setpoint;
  gasConfirmed_ = false;
}

Reading ColeParmerMFC::read() {
  auto frame = cp::parseFrame(query(cp::poll()));
  lastEcho_ = frame.setpoint;

  return Reading{ { VariableType::Pressure, frame.pressure },
                  { VariableType::Temperature, frame.temperature },
                  { VariableType::VolumeFlow, frame.volumeFlow },
                  { VariableType::MassFlow, frame.massFlow } };
}

void ColeParmerMFC::writeSetpoint(VariableType type, double value) {
  if (type != VariableType::MassFlow) {
    throw UnsupportedSettingError(std::string("Cole-Parmer MFC does not support ") +
                                  toString(type) + " setpoints.");
  }
  if (!std::isfinite(value) || value < 0.0) {
    throw OutOfRangeError("Mass flow controller setpoint must be greater than or equal to 0. "
                          "Attempted setpoint was: " +
                          protocols::formatFixed(std::isfinite(value) ? value : 0.0, 3));
  }

  pushSetpoint(value);
  massFlowSetpoint_ = value;
}

// "AS4.540" = setpoint 4.54 on device A; the unit answers with a data frame
void ColeParmerMFC::pushSetpoint(double value) {
  auto frame = cp::parseFrame(query(cp::setSetpoint(value)));
  lastEcho_ = frame.setpoint;

  if (std::fabs(frame.setpoint - value) > options_.echoTolerance) {
    throw CommunicationError("Could not write setpoint (" + protocols::formatFixed(value, 3) +
                             ") to mass flow controller. Value read from instrument (" +
                             protocols::formatFixed(frame.setpoint, 3) + ") was incorrect.");
  }
}

double ColeParmerMFC::readSetpoint(VariableType type) {
  if (type != VariableType::MassFlow) {
    throw UnsupportedSettingError(std::string("Cole-Parmer MFC does not support ") +
                                  toString(type) + " setpoints.");
  }
  return massFlowSetpoint_;
}

void ColeParmerMFC::setControlMode(ControlMode mode) {
  switch (mode) {
  case ControlMode::Passive:
    // no real passive mode; a zero setpoint closes the valve
    pushSetpoint(0.0);
    break;
  case ControlMode::Active:
    pushSetpoint(massFlowSetpoint_);
    break;
  case ControlMode::Measure:
    if (!options_.allowOpenValveMeasure) {
      throw UnsupportedSettingError(
          "Cole-Parmer MFC measure mode forces the valve fully open and is disabled for this "
          "instrument.");
    }
    pushSetpoint(options_.openValveSetpoint);
    break;
  }
}

// "A$$12" selects propane on device A; the frame's gas token must echo the request
void ColeParmerMFC::setGas(protocols::Gas gas) {
  gas_ = gas;
  gasConfirmed_ = false;

  auto frame = cp::parseFrame(query(cp::selectGas(gas)));
  lastEcho_ = frame.setpoint;

  const auto expected = protocols::gasCode(gas).echo;
  if (frame.gas != expected) {
    throw CommunicationError("Could not write gas selection to mass flow controller. Requested " +
                             std::string(expected) + ", instrument reports " + frame.gas + ".");
  }
  gasConfirmed_ = true;
}

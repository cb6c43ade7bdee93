#pragma once
/** @file  Keysight34972A.hpp
 *  @brief Driver for the Keysight 34972A datalogger used to read analog DUT outputs.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <memory>
#include <string>

// FlowCal headers
#include "devices/SerialDevice.hpp"

namespace flowcal::devices {

  class Keysight34972A : public SerialDevice, public DutInterfaceDevice {
  public:
    static constexpr int kDefaultBaud = 9600;

    static io::SerialSettings defaultSettings(std::string port);

    Keysight34972A(std::unique_ptr<io::SerialChannel> channel, io::SerialSettings settings);

    std::string model() const override { return "Keysight 34972A datalogger"; }

    /// DC volts on one multiplexer channel (101..320); OutOfRangeError for anything else.
    double readChannel(unsigned channel) override;

    const std::string& identity() const { return identity_; }

  protected:
    void validate(const io::SerialSettings& settings) const override;
    void onOpened() override; ///< *IDN? must name a 3497x mainframe

  private:
    std::string identity_;
  };

} // namespace flowcal::devices

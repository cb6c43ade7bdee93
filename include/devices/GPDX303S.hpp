#pragma once
/** @file  GPDX303S.hpp
 *  @brief Driver for the GW Instek GPD-X303S programmable power supply.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <memory>
#include <string>

// FlowCal headers
#include "devices/SerialDevice.hpp"

namespace flowcal::devices {

  /**
 * @class GPDX303S
 * @brief Linear DC supply used to excite the DUTs; one output channel per driver.
 *
 *  Setpoints are confirmed by reading VSET?/ISET? back, so readSetpoint() is a
 *  true device query on this model.
 */
  class GPDX303S : public SerialDevice,
                   public VoltageReference,
                   public CurrentReference,
                   public VoltageController,
                   public CurrentController {
  public:
    static constexpr double kDefaultEchoTolerance = 0.01;
    static constexpr double kMaxVoltage = 30.0;
    static constexpr double kMaxCurrent = 3.0;
    static constexpr int kDefaultBaud = 9600;

    struct Options {
      unsigned channel{ 1 }; ///< CH1 or CH2 (the fixed 5 V outputs are not programmable)
      double echoTolerance{ kDefaultEchoTolerance };
    };

    static io::SerialSettings defaultSettings(std::string port);

    GPDX303S(std::unique_ptr<io::SerialChannel> channel, io::SerialSettings settings,
             Options options);
    GPDX303S(std::unique_ptr<io::SerialChannel> channel, io::SerialSettings settings);

    std::string model() const override { return "GPD-X303S power supply"; }

    Reading read() override;

    void writeSetpoint(VariableType type, double value) override;
    double readSetpoint(VariableType type) override;
    void setControlMode(ControlMode mode) override;

  protected:
    void validate(const io::SerialSettings& settings) const override;

  private:
    double queryValue(const protocols::Command& cmd);

    Options options_;
  };

} // namespace flowcal::devices

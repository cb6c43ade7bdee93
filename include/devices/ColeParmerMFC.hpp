#pragma once
/** @file  ColeParmerMFC.hpp
 *  @brief Driver for the Cole-Parmer mass flow controller.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <memory>
#include <optional>
#include <string>

// FlowCal headers
#include "devices/SerialDevice.hpp"

namespace flowcal::devices {

  /**
 * @class ColeParmerMFC
 * @brief Mass-flow controller that also reports pressure, temperature and
 *        volume flow in every polled frame.
 *
 *  * Polling mode, fixed address 'A', one unit per link.
 *  * readSetpoint() returns the last confirmed setpoint; the device is not
 *    queried, so "what we asked for" never mixes with "what it is doing".
 *  * ControlMode::Measure is the open-valve mode: an oversized setpoint
 *    starves the controller so flow can be read with the valve fully open.
 *    This stresses the valve and damages it over time (roughly a day of
 *    cumulative use), so it stays disabled unless explicitly enabled.
 */
  class ColeParmerMFC : public SerialDevice,
                        public MassFlowController,
                        public MassFlowReference,
                        public VolumeFlowReference,
                        public PressureReference,
                        public TemperatureReference,
                        public GasSelectable {
  public:
    static constexpr double kDefaultEchoTolerance = 1.0;
    static constexpr int kDefaultBaud = 19200;

    struct Options {
      double echoTolerance{ kDefaultEchoTolerance };
      bool allowOpenValveMeasure{ false };
      double openValveSetpoint{ 0.0 }; ///< must exceed the unit's full scale to open the valve
    };

    /// Link defaults for this model: 19200 8N1, '\r' terminated, 500 ms timeouts.
    static io::SerialSettings defaultSettings(std::string port);

    ColeParmerMFC(std::unique_ptr<io::SerialChannel> channel, io::SerialSettings settings,
                  Options options);
    ColeParmerMFC(std::unique_ptr<io::SerialChannel> channel, io::SerialSettings settings);

    std::string model() const override { return "Cole-Parmer MFC"; }

    //---ReferenceDevice--------------------------------------------------
    Reading read() override;

    //---ControlDevice----------------------------------------------------
    void writeSetpoint(VariableType type, double value) override;
    double readSetpoint(VariableType type) override;
    void setControlMode(ControlMode mode) override;

    //---GasSelectable----------------------------------------------------
    void setGas(protocols::Gas gas) override;
    protocols::Gas gas() const override { return gas_; }
    bool gasConfirmed() const { return gasConfirmed_; }

    /// Setpoint echoed in the most recent frame, if any frame was read.
    std::optional<double> lastEchoedSetpoint() const { return lastEcho_; }

  protected:
    void validate(const io::SerialSettings& settings) const override;
    void onOpened() override;

  private:
    void pushSetpoint(double value);

    Options options_;
    double massFlowSetpoint_{ 0.0 };
    std::optional<double> lastEcho_{};
    protocols::Gas gas_{ protocols::Gas::Air };
    bool gasConfirmed_{ false };
  };

} // namespace flowcal::devices

#pragma once
/** @file  Settings.hpp
 *  @brief Configuration snapshot handed to TestCoordinator::start().
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <optional>
#include <string>
#include <vector>

// FlowCal headers
#include "io/SerialChannel.hpp"
#include "protocols/Gas.hpp"

namespace flowcal::core {

  /// Link settings from the bench configuration; anything unset keeps the model's default.
  struct SerialOverrides {
    std::string port;
    std::optional<int> baudRate{};
    std::optional<int> dataBits{};
    std::optional<io::Parity> parity{};
    std::optional<io::StopBits> stopBits{};
    std::optional<std::chrono::milliseconds> readTimeout{};
    std::optional<std::chrono::milliseconds> writeTimeout{};

    io::SerialSettings applyTo(io::SerialSettings defaults) const {
      defaults.port = port;
      defaults.baudRate = baudRate.value_or(defaults.baudRate);
      defaults.dataBits = dataBits.value_or(defaults.dataBits);
      defaults.parity = parity.value_or(defaults.parity);
      defaults.stopBits = stopBits.value_or(defaults.stopBits);
      defaults.readTimeout = readTimeout.value_or(defaults.readTimeout);
      defaults.writeTimeout = writeTimeout.value_or(defaults.writeTimeout);
      return defaults;
    }
  };

  /// One instrument on the bench and how to reach it.
  struct InstrumentSetting {
    std::string model; ///< DeviceFactory key, e.g. "ColeParmerMFC"
    SerialOverrides serial{};
    std::optional<double> echoTolerance{};
    bool allowOpenValveMeasure{ false };
    double openValveSetpoint{ 0.0 };
    unsigned channel{ 1 };
  };

  struct EquipmentSettings {
    std::vector<InstrumentSetting> instruments;
    protocols::Gas gas{ protocols::Gas::Air };
    std::optional<double> dutSupplyVoltage{}; ///< powers the DUTs when a voltage controller exists
    unsigned dutChannelBase{ 100 };           ///< DUT n is wired to datalogger channel base + n
  };

  /// Electrical behaviour of one DUT model.
  struct ModelSetting {
    std::string label;
    double outputMin{ 0.0 };         ///< volts at the bottom of the range
    double outputMax{ 5.0 };         ///< volts at the top of the range
    double presenceThreshold{ 0.0 }; ///< below this the DUT is treated as absent
  };

  /// Flow span that the model's output voltage maps onto.
  struct RangeSetting {
    std::string label;
    double min{ 0.0 };
    double max{ 0.0 };
  };

  struct TestSetting {
    std::string label;
    std::string protocol{ "FlowSweep" }; ///< ProtocolFactory key
    std::vector<double> setpoints;       ///< mass flow, applied in order
    std::chrono::milliseconds dwell{ 0 };
    unsigned samples{ 1 };
    std::chrono::milliseconds sampleInterval{ 0 };
    double tolerancePercent{ 1.0 }; ///< of the reference reading
    double toleranceFloor{ 0.0 };   ///< absolute slack, keeps a zero setpoint testable
  };

  /// Per-DUT choices taken from the UI when Start was pressed.
  struct DutSelection {
    std::string serialNumber;
    bool selected{ true };
    std::string modelLabel;
  };

  struct RunConfig {
    EquipmentSettings equipment;
    std::vector<ModelSetting> models;
    std::vector<RangeSetting> ranges;
    std::vector<TestSetting> tests;
    std::string rangeLabel;
    std::string testLabel;
    std::vector<DutSelection> duts;
    std::string logDirectory; ///< empty disables the CSV run log
  };

  //---label resolution (throws ConfigurationError)----------------------
  const ModelSetting& findModel(const RunConfig& config, const std::string& label);
  const RangeSetting& findRange(const RunConfig& config, const std::string& label);
  const TestSetting& findTest(const RunConfig& config, const std::string& label);

} // namespace flowcal::core

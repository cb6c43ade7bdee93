#pragma once
/** @file  Capabilities.hpp
 *  @brief Narrow capability interfaces every instrument driver picks from.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

// FlowCal headers
#include "devices/Types.hpp"
#include "protocols/Gas.hpp"

namespace flowcal::devices {

  /**
 * @class Instrument
 * @brief Lifecycle shared by every piece of test equipment.
 *
 *  Equipment owns instruments through this type and discovers what they can
 *  do by cross-casting to the capability interfaces below.
 */
  class Instrument {
  public:
    virtual ~Instrument() = default;

    virtual void open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
    virtual std::string model() const = 0;
  };

  /// Anything that reports measured values.
  class ReferenceDevice {
  public:
    virtual ~ReferenceDevice() = default;

    /// One poll; fills only the VariableTypes this instrument measures.
    virtual Reading read() = 0;
  };

  /// Anything that regulates to a commanded value.
  class ControlDevice {
  public:
    virtual ~ControlDevice() = default;

    virtual void writeSetpoint(VariableType type, double value) = 0;
    virtual double readSetpoint(VariableType type) = 0;
    virtual void setControlMode(ControlMode mode) = 0;
  };

  /**
 * @class Reference
 * @brief Marker: "can report V". A driver inherits one per measured type;
 *        the shared virtual base means a single read() serves them all.
 */
  template <VariableType V> class Reference : public virtual ReferenceDevice {
  public:
    static constexpr VariableType kType = V;

    /// Convenience: poll and pick out this capability's value.
    double readValue() { return read().at(V); }
  };

  /// Marker: "can be commanded to V".
  template <VariableType V> class Controller : public virtual ControlDevice {
  public:
    static constexpr VariableType kType = V;

    void writeValue(double value) { writeSetpoint(V, value); }
    double readValue() { return readSetpoint(V); }
  };

  using MassFlowReference = Reference<VariableType::MassFlow>;
  using VolumeFlowReference = Reference<VariableType::VolumeFlow>;
  using VelocityReference = Reference<VariableType::Velocity>;
  using PressureReference = Reference<VariableType::Pressure>;
  using TemperatureReference = Reference<VariableType::Temperature>;
  using VoltageReference = Reference<VariableType::Voltage>;
  using CurrentReference = Reference<VariableType::Current>;

  using MassFlowController = Controller<VariableType::MassFlow>;
  using VolumeFlowController = Controller<VariableType::VolumeFlow>;
  using VelocityController = Controller<VariableType::Velocity>;
  using PressureController = Controller<VariableType::Pressure>;
  using TemperatureController = Controller<VariableType::Temperature>;
  using VoltageController = Controller<VariableType::Voltage>;
  using CurrentController = Controller<VariableType::Current>;

  /// Flow instruments whose conversion curve depends on the gas.
  class GasSelectable {
  public:
    virtual ~GasSelectable() = default;

    /// Store and push the selection, verifying the device's echo.
    virtual void setGas(protocols::Gas gas) = 0;
    virtual protocols::Gas gas() const = 0;
  };

  /// Reads the raw analog output of a DUT wired to a measurement channel.
  class DutInterfaceDevice {
  public:
    virtual ~DutInterfaceDevice() = default;

    virtual double readChannel(unsigned channel) = 0;
  };

  //---capability lookup (exhaustive over VariableType)------------------
  ReferenceDevice* asReference(Instrument& instrument, VariableType type);
  ControlDevice* asController(Instrument& instrument, VariableType type);

} // namespace flowcal::devices

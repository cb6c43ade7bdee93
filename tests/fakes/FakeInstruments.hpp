#pragma once
/** @file  FakeInstruments.hpp
 *  @brief In-memory instruments for Equipment and TestCoordinator testing.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "core/Errors.hpp"
#include "devices/Capabilities.hpp"

namespace flowcal {
  namespace test {

    /// Shared with the test so it outlives the instrument (Equipment owns and destroys it).
    struct FakeMfcState {
      double massFlow = 0.0;
      bool failOpen = false;
      bool failRead = false;
      bool failClose = false;
      bool rejectGas = false;

      std::vector<double> setpoints;
      std::vector<devices::ControlMode> modes;
      std::vector<protocols::Gas> gases;
      int reads = 0;
      std::atomic<int> opens{ 0 };
      std::atomic<int> closes{ 0 };
      std::atomic<bool> open{ false };

      /// Every command after the gas selection, whatever it was.
      int commandsAfterGas = 0;
    };

    /**
 * @class FakeMfc
 * @brief Mass flow controller + reference that reports whatever the test set.
 */
    class FakeMfc : public devices::Instrument,
                    public devices::MassFlowController,
                    public devices::MassFlowReference,
                    public devices::GasSelectable {
    public:
      explicit FakeMfc(std::shared_ptr<FakeMfcState> state) : state_(std::move(state)) {}

      void open() override {
        ++state_->opens;
        if (state_->failOpen)
          throw core::PortUnavailableError("fake MFC port is missing");
        state_->open = true;
      }

      void close() override {
        ++state_->closes;
        state_->open = false;
        if (state_->failClose)
          throw core::CommunicationError("fake MFC did not close");
      }

      bool isOpen() const override { return state_->open; }
      std::string model() const override { return "FakeMfc"; }

      devices::Reading read() override {
        touch();
        ++state_->reads;
        if (state_->failRead)
          throw core::TimeoutError("fake MFC stopped answering");
        return devices::Reading{ { devices::VariableType::MassFlow, state_->massFlow } };
      }

      void writeSetpoint(devices::VariableType, double value) override {
        touch();
        if (value < 0.0)
          throw core::OutOfRangeError("negative setpoint");
        state_->setpoints.push_back(value);
      }

      double readSetpoint(devices::VariableType) override {
        return state_->setpoints.empty() ? 0.0 : state_->setpoints.back();
      }

      void setControlMode(devices::ControlMode mode) override {
        touch();
        state_->modes.push_back(mode);
      }

      void setGas(protocols::Gas gas) override {
        state_->gases.push_back(gas);
        gas_ = gas;
        gasSelected_ = true;
        if (state_->rejectGas)
          throw core::CommunicationError("Could not write gas selection to mass flow controller.");
      }

      protocols::Gas gas() const override { return gas_; }

    private:
      void touch() {
        if (gasSelected_)
          ++state_->commandsAfterGas;
      }

      std::shared_ptr<FakeMfcState> state_;
      protocols::Gas gas_{ protocols::Gas::Air };
      bool gasSelected_ = false;
    };

    struct FakeDataloggerState {
      std::map<unsigned, double> volts; ///< channel → reading; missing channels read 0 V
      std::set<unsigned> failing;       ///< channels that throw CommunicationError
      bool failOpen = false;
      std::vector<unsigned> readOrder;
      std::function<void(unsigned)> onRead; ///< runs before each reading, e.g. to request a stop
      std::atomic<int> closes{ 0 };
      std::atomic<bool> open{ false };
    };

    /**
 * @class FakeDatalogger
 * @brief DUT interface returning per-channel voltages from its state.
 */
    class FakeDatalogger : public devices::Instrument, public devices::DutInterfaceDevice {
    public:
      explicit FakeDatalogger(std::shared_ptr<FakeDataloggerState> state)
          : state_(std::move(state)) {}

      void open() override {
        if (state_->failOpen)
          throw core::PortUnavailableError("fake datalogger port is missing");
        state_->open = true;
      }

      void close() override {
        ++state_->closes;
        state_->open = false;
      }

      bool isOpen() const override { return state_->open; }
      std::string model() const override { return "FakeDatalogger"; }

      double readChannel(unsigned channel) override {
        if (state_->onRead)
          state_->onRead(channel);
        state_->readOrder.push_back(channel);
        if (state_->failing.count(channel) != 0)
          throw core::CommunicationError("channel " + std::to_string(channel) + " did not answer");
        auto it = state_->volts.find(channel);
        return it == state_->volts.end() ? 0.0 : it->second;
      }

    private:
      std::shared_ptr<FakeDataloggerState> state_;
    };

    struct FakeSupplyState {
      std::vector<double> volts;
      std::vector<devices::ControlMode> modes;
      std::atomic<bool> open{ false };
    };

    /// Voltage controller standing in for the DUT power supply.
    class FakeSupply : public devices::Instrument,
                       public devices::VoltageController,
                       public devices::VoltageReference {
    public:
      explicit FakeSupply(std::shared_ptr<FakeSupplyState> state) : state_(std::move(state)) {}

      void open() override { state_->open = true; }
      void close() override { state_->open = false; }
      bool isOpen() const override { return state_->open; }
      std::string model() const override { return "FakeSupply"; }

      devices::Reading read() override {
        return devices::Reading{ { devices::VariableType::Voltage,
                                   state_->volts.empty() ? 0.0 : state_->volts.back() } };
      }

      void writeSetpoint(devices::VariableType, double value) override {
        state_->volts.push_back(value);
      }

      double readSetpoint(devices::VariableType) override {
        return state_->volts.empty() ? 0.0 : state_->volts.back();
      }

      void setControlMode(devices::ControlMode mode) override { state_->modes.push_back(mode); }

    private:
      std::shared_ptr<FakeSupplyState> state_;
    };

  } // namespace test
} // namespace flowcal

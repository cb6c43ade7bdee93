#pragma once

/** @file  TestCoordinator.hpp
 *  @brief Public API for flowcal::core::TestCoordinator.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/Dut.hpp"
#include "core/Equipment.hpp"
#include "core/Logger.hpp"
#include "core/Settings.hpp"
#include "protocols/CalibrationProtocol.hpp"

namespace flowcal {
  namespace core {

    class DeviceFactory;
    class ErrorMonitor;
    class ProtocolFactory;
    class RunObserver;

    /**
 * @class TestCoordinator
 * @brief Run state machine: Idle → Initializing → Running → (Aborting →) Completing → Idle.
 *
 *  * One run at a time, executed on a single dedicated worker thread.
 *  * A failed setup returns from Initializing straight to Idle.
 *  * stop() is cooperative: the worker stops at its next checkpoint.
 *  * Observer callbacks come from the worker thread.
 */
    class TestCoordinator : private protocols::RunControl {

    public:
      enum class State { Idle, Initializing, Running, Aborting, Completing };

      TestCoordinator(std::shared_ptr<DeviceFactory> devices,
                      std::shared_ptr<ProtocolFactory> protocols,
                      std::shared_ptr<ErrorMonitor> errorMonitor,
                      std::shared_ptr<RunObserver> observer);
      ~TestCoordinator() override; ///< requests a stop and joins the worker

      // ---- public API ----------------------------------------------------
      /// Resolve labels, build DUTs + equipment, launch the worker.
      /// Throws std::logic_error when busy, ConfigurationError for unknown labels.
      void start(const RunConfig& config);
      void stop();        ///< no-op when Idle
      bool isBusy() const; ///< true in every state except Idle

      State state() const;
      int progress() const;
      std::string lastMessage() const;
      std::vector<Dut> duts() const; ///< snapshot copy, safe while a run is active

      bool waitUntilIdle(std::chrono::milliseconds timeout) const;

      /// Called on every state change, from whichever thread made it.
      void registerStateCallback(std::function<void(State)> cb);

      TestCoordinator(const TestCoordinator&) = delete;
      TestCoordinator& operator=(const TestCoordinator&) = delete;

    private:
      struct Job {
        protocols::RunPlan plan;
        std::unique_ptr<protocols::CalibrationProtocol> protocol;
        std::unique_ptr<Equipment> equipment;
        EquipmentSettings settings;
        std::vector<unsigned> defaultedSerials; ///< DUTs whose serial number was generated
        std::string logPath;
      };

      void execute(Job job);
      void initialize(Equipment& equipment, const EquipmentSettings& settings);
      void complete(Equipment& equipment, bool setupDone);
      void failRun(std::vector<Dut>& duts, const std::string& reason, bool everySelected);

      void transitionTo(State next);
      void enterRunning(); ///< Initializing → Running unless a stop already arrived

      //---RunControl (worker thread only)----------------------------------
      void checkpoint() override;
      void dwell(std::chrono::milliseconds duration) override;
      void reportProgress(int percent, const std::string& message) override;
      void setDutStatus(Dut& dut, DutStatus status, const std::string& message = {}) override;
      void record(const LogEvent& event) override;

      std::shared_ptr<DeviceFactory> devices_;
      std::shared_ptr<ProtocolFactory> protocols_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<RunObserver> observer_;
      std::function<void(State)> stateCallback_{};

      mutable std::mutex mtx_;
      mutable std::condition_variable cv_;
      State state_{ State::Idle };
      std::atomic<bool> cancel_{ false };
      int percent_{ 0 };
      std::string message_{};
      std::vector<Dut> duts_;

      Logger logger_;
      std::thread worker_;
    };

    const char* toString(TestCoordinator::State s);

  } // namespace core
} // namespace flowcal

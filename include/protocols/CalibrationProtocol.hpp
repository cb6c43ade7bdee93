#pragma once
/** @file  CalibrationProtocol.hpp
 *  @brief Abstract base class for every calibration sequence.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <exception>
#include <string>
#include <vector>

#include "core/Dut.hpp"
#include "core/Settings.hpp"

namespace flowcal::core { // forward decls only
  class Equipment;
  struct LogEvent;
} // namespace flowcal::core

namespace flowcal::protocols {

  /// Thrown from a checkpoint once a stop has been requested.
  class RunAborted : public std::exception {
  public:
    const char* what() const noexcept override { return "test aborted"; }
  };

  /// What one run is asked to do, resolved from the configuration labels.
  struct RunPlan {
    core::TestSetting test;
    core::RangeSetting range;
    unsigned dutChannelBase{ 100 };
  };

  /**
 * @class RunControl
 * @brief The coordinator's side of a run, handed to the protocol.
 *
 *  * checkpoint()/dwell() are the only places a stop request is honoured,
 *    so a command exchange is never cut short.
 *  * setDutStatus() is the only way a protocol may change a DUT.
 */
  class RunControl {
  public:
    virtual ~RunControl() = default;

    virtual void checkpoint() = 0;                               ///< throws RunAborted
    virtual void dwell(std::chrono::milliseconds duration) = 0; ///< interruptible wait, then checkpoint
    virtual void reportProgress(int percent, const std::string& message) = 0;
    virtual void setDutStatus(core::Dut& dut, core::DutStatus status,
                              const std::string& message = {}) = 0;
    virtual void record(const core::LogEvent& event) = 0;
  };

  /**
 * @class CalibrationProtocol
 * @brief Common polymorphic interface that every concrete sequence must implement.
 *
 *  * Runs synchronously on the coordinator's worker thread.
 *  * Owns no hardware; it talks through Equipment capability views.
 *  * Per-DUT problems are recorded on the DUT; anything thrown ends the run.
 */
  class CalibrationProtocol {
  public:
    virtual ~CalibrationProtocol() = default;

    /**
     * @brief Execute the sequence against every selected DUT.
     *
     * @param equipment Opened instruments for this run.
     * @param duts      The run's DUTs (selected and unselected).
     * @param plan      Test and range settings.
     * @param control   Progress, status and cancellation hooks.
     */
    virtual void run(core::Equipment& equipment, std::vector<core::Dut>& duts,
                     const RunPlan& plan, RunControl& control) = 0;
  };

} // namespace flowcal::protocols

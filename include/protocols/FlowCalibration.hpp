#pragma once
/** @file  FlowCalibration.hpp
 *  @brief Mass-flow sweep: discover DUTs, step the controller, compare each DUT to the reference.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include "protocols/CalibrationProtocol.hpp"

namespace flowcal::protocols {

  /**
 * @class FlowCalibration
 * @brief Registered as "FlowSweep".
 *
 *  1. Discovery: read every selected DUT once → Found / NotFound / PortError.
 *  2. Per setpoint: command the MFC, dwell, average `samples` snapshots and
 *     DUT readings, fail any DUT outside tolerance.
 *  3. DUTs still Found at the end pass.
 */
  class FlowCalibration : public CalibrationProtocol {
  public:
    void run(core::Equipment& equipment, std::vector<core::Dut>& duts, const RunPlan& plan,
             RunControl& control) override;

    static bool withinTolerance(double measured, double reference, const core::TestSetting& test);
  };

} // namespace flowcal::protocols

/* @file FlowCalibration.cpp
 * @brief Mass-flow sweep sequence.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <unordered_map>

// FlowCal headers
#include "core/Equipment.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "protocols/FlowCalibration.hpp"
#include "protocols/Response.hpp"

using namespace flowcal::protocols;
using flowcal::core::Dut;
using flowcal::core::DutStatus;
using flowcal::devices::VariableType;

namespace {

  std::string flow(double value) { return formatFixed(value, 3); }

  std::string dutName(const Dut& dut) { return "DUT " + std::to_string(dut.index); }

} // namespace

bool FlowCalibration::withinTolerance(double measured, double reference,
                                      const core::TestSetting& test) {
  const double allowed = test.tolerancePercent / 100.0 * std::fabs(reference) + test.toleranceFloor;
  return std::fabs(measured - reference) <= allowed;
}

void FlowCalibration::run(core::Equipment& equipment, std::vector<Dut>& duts, const RunPlan& plan,
                          RunControl& control) {
  auto& controller = equipment.massFlowController();
  auto& datalogger = equipment.dutInterface();

  std::vector<Dut*> selected;
  for (auto& dut : duts) {
    if (dut.selected)
      selected.push_back(&dut);
  }

  const auto& setpoints = plan.test.setpoints;
  const std::size_t totalSteps = selected.size() + setpoints.size() * (1 + selected.size());
  std::size_t done = 0;
  auto percent = [&] {
    return totalSteps == 0 ? 100 : static_cast<int>(done * 100 / totalSteps);
  };
  auto channelOf = [&](const Dut& dut) { return plan.dutChannelBase + dut.index; };

  //---discovery-----------------------------------------------------------
  for (auto* dut : selected) {
    control.checkpoint();
    try {
      const double volts = datalogger.readChannel(channelOf(*dut));
      if (dut->isPresent(volts))
        control.setDutStatus(*dut, DutStatus::Found);
      else
        control.setDutStatus(*dut, DutStatus::NotFound,
                             "Output " + formatFixed(volts, 3) + " V is below presence threshold.");
    } catch (const core::DeviceError& e) {
      control.setDutStatus(*dut, DutStatus::PortError, e.what());
    }
    ++done;
    control.reportProgress(percent(), "Searching for " + dutName(*dut) + "...");
  }

  auto testing = [&] {
    std::vector<Dut*> found;
    for (auto* dut : selected) {
      if (dut->status == DutStatus::Found)
        found.push_back(dut);
    }
    return found;
  };

  //---setpoint sweep------------------------------------------------------
  const unsigned samples = std::max(1u, plan.test.samples);
  bool active = false;

  for (double setpoint : setpoints) {
    control.checkpoint();

    auto found = testing();
    if (found.empty())
      break;

    controller.writeSetpoint(VariableType::MassFlow, setpoint);
    if (!active) {
      controller.setControlMode(devices::ControlMode::Active);
      active = true;
    }
    control.reportProgress(percent(), "Setting mass flow to " + flow(setpoint) + "...");
    control.dwell(plan.test.dwell);

    double referenceSum = 0.0;
    std::unordered_map<unsigned, double> dutSums;

    for (unsigned s = 0; s < samples; ++s) {
      if (s > 0)
        control.dwell(plan.test.sampleInterval);

      // reference failures are not local to a DUT: let them end the run
      referenceSum += equipment.read().value(VariableType::MassFlow);

      for (auto* dut : found) {
        if (dut->status != DutStatus::Found)
          continue;
        control.checkpoint();
        try {
          dutSums[dut->index] += dut->toFlow(datalogger.readChannel(channelOf(*dut)), plan.range);
        } catch (const core::DeviceError& e) {
          control.setDutStatus(*dut, DutStatus::PortError, e.what());
        }
      }
    }
    ++done;

    const double reference = referenceSum / samples;
    for (auto* dut : found) {
      if (dut->status == DutStatus::Found) {
        const double measured = dutSums[dut->index] / samples;
        const bool ok = withinTolerance(measured, reference, plan.test);

        core::LogEvent event;
        event.timestamp = std::chrono::system_clock::now();
        event.dutIndex = dut->index;
        event.serialNumber = dut->serialNumber;
        event.setpoint = setpoint;
        event.reference = reference;
        event.measured = measured;
        event.result = ok ? "ok" : "out of tolerance";
        control.record(event);

        if (!ok) {
          control.setDutStatus(*dut, DutStatus::Fail,
                               "Read " + flow(measured) + " against reference " + flow(reference) +
                                   " at setpoint " + flow(setpoint) + ".");
        }
      }
      ++done;
      control.reportProgress(percent(), "Checked " + dutName(*dut) + " at " + flow(setpoint) + ".");
    }
    done += selected.size() - found.size();
  }

  for (auto* dut : testing())
    control.setDutStatus(*dut, DutStatus::Pass);

  control.reportProgress(100, "Test complete.");
}

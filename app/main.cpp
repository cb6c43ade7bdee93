/* @file main.cpp
 * @brief flowcal-run: execute one calibration run from a JSON configuration.
 *
 *   usage: flowcal-run <config.json>
 *   exit:  0 every selected DUT passed, 1 otherwise, 2 configuration error
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>

// FlowCal headers
#include "core/ConfigLoader.hpp"
#include "core/DeviceFactory.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/EventChannel.hpp"
#include "core/ProtocolFactory.hpp"
#include "core/TestCoordinator.hpp"

using namespace flowcal::core;

namespace {

  std::atomic<bool> interrupted{ false };

  void onSigint(int) { interrupted = true; }

  void print(const RunEvent& e) {
    switch (e.type) {
    case RunEvent::Type::Progress:
      std::cout << "[" << e.percent << "%] " << e.text << '\n';
      break;
    case RunEvent::Type::DutStatus:
      std::cout << "DUT " << e.dutIndex << ": " << toString(e.status) << '\n';
      break;
    case RunEvent::Type::DutSerialNumber:
      std::cout << "DUT " << e.dutIndex << " serial number: " << e.text << '\n';
      break;
    case RunEvent::Type::Finished:
      std::cout << "Run finished.\n";
      break;
    }
  }

} // namespace

int main(int argc, char** argv) {
  if (argc != 2) {
    std::cerr << "usage: " << argv[0] << " <config.json>\n";
    return 2;
  }

  RunConfig config;
  try {
    config = ConfigLoader(argv[1]).loadRunConfig();
  } catch (const std::runtime_error& e) {
    std::cerr << e.what() << '\n';
    return 2;
  }

  auto events = std::make_shared<EventChannel>();
  auto errors = std::make_shared<ErrorMonitor>();
  errors->registerEscalation(
      [](const std::string& message) { std::cerr << "[flowcal-run] FAULT: " << message << '\n'; });

  TestCoordinator coordinator(DeviceFactory::withBuiltins(), ProtocolFactory::withBuiltins(),
                              errors, events);

  try {
    coordinator.start(config);
  } catch (const ConfigurationError& e) {
    std::cerr << e.what() << '\n';
    return 2;
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << '\n';
    return 2;
  }

  std::signal(SIGINT, onSigint);

  bool finished = false;
  while (!finished) {
    if (interrupted.exchange(false)) {
      std::cout << "Stopping...\n";
      coordinator.stop();
    }
    if (auto event = events->next(std::chrono::milliseconds(100))) {
      print(*event);
      finished = event->type == RunEvent::Type::Finished;
    }
  }
  coordinator.waitUntilIdle(std::chrono::seconds(5));

  bool allPassed = true;
  for (const auto& dut : coordinator.duts()) {
    if (!dut.selected)
      continue;
    std::cout << "DUT " << dut.index << " (" << dut.serialNumber << "): " << toString(dut.status);
    if (!dut.message.empty())
      std::cout << " - " << dut.message;
    std::cout << '\n';
    allPassed = allPassed && dut.status == DutStatus::Pass;
  }
  return allPassed ? 0 : 1;
}

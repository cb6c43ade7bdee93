/* @file TestCoordinator.cpp
 * @brief Run state machine and its worker thread.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cassert>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

// FlowCal headers
#include "core/DeviceFactory.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/ProtocolFactory.hpp"
#include "core/RunObserver.hpp"
#include "core/TestCoordinator.hpp"

using namespace flowcal::core;
using flowcal::devices::ControlMode;
using flowcal::protocols::RunAborted;

namespace {

  std::string logFileName(const std::string& directory, const std::string& label) {
    const std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);

    std::ostringstream name;
    name << label << '_' << std::put_time(&local, "%Y%m%d-%H%M%S") << ".csv";
    return (std::filesystem::path(directory) / name.str()).string();
  }

} // namespace

namespace flowcal::core {

  const char* toString(TestCoordinator::State s) {
    switch (s) {
    case TestCoordinator::State::Idle:
      return "Idle";
    case TestCoordinator::State::Initializing:
      return "Initializing";
    case TestCoordinator::State::Running:
      return "Running";
    case TestCoordinator::State::Aborting:
      return "Aborting";
    case TestCoordinator::State::Completing:
      return "Completing";
    }
    return "Unknown";
  }

} // namespace flowcal::core

TestCoordinator::TestCoordinator(std::shared_ptr<DeviceFactory> devices,
                                 std::shared_ptr<ProtocolFactory> protocols,
                                 std::shared_ptr<ErrorMonitor> errorMonitor,
                                 std::shared_ptr<RunObserver> observer)
    : devices_{ std::move(devices) }, protocols_{ std::move(protocols) },
      errorMonitor_{ std::move(errorMonitor) }, observer_{ std::move(observer) } {
  assert(devices_ && "[TestCoordinator] device factory is nullptr");
  assert(protocols_ && "[TestCoordinator] protocol factory is nullptr");
  assert(errorMonitor_ && "[TestCoordinator] error monitor is nullptr");
  assert(observer_ && "[TestCoordinator] observer is nullptr");
}

TestCoordinator::~TestCoordinator() {
  stop();
  if (worker_.joinable())
    worker_.join();
}

//------------------------------------------------------------------------------
//  public API
//------------------------------------------------------------------------------
void TestCoordinator::start(const RunConfig& config) {
  Job job;
  {
    std::lock_guard lock(mtx_);
    if (state_ != State::Idle)
      throw std::logic_error("[TestCoordinator] a test is already running");

    const auto& test = findTest(config, config.testLabel);
    const auto& range = findRange(config, config.rangeLabel);
    if (test.samples == 0)
      throw ConfigurationError("Test settings \"" + test.label + "\" take no samples.");

    std::vector<Dut> duts;
    duts.reserve(config.duts.size());
    for (std::size_t i = 0; i < config.duts.size(); ++i) {
      const auto& selection = config.duts[i];
      Dut dut;
      dut.index = static_cast<unsigned>(i + 1);
      dut.selected = selection.selected;
      dut.serialNumber = selection.serialNumber;
      if (dut.serialNumber.empty()) {
        dut.serialNumber = "DUT" + std::to_string(dut.index);
        job.defaultedSerials.push_back(dut.index);
      }
      if (dut.selected) {
        dut.model = findModel(config, selection.modelLabel);
        if (dut.model.outputMax <= dut.model.outputMin) {
          throw ConfigurationError("Model settings \"" + dut.model.label +
                                   "\" have an empty output span.");
        }
      }
      duts.push_back(std::move(dut));
    }

    job.plan.test = test;
    job.plan.range = range;
    job.plan.dutChannelBase = config.equipment.dutChannelBase;
    job.protocol = protocols_->create(test.protocol);
    job.equipment = std::make_unique<Equipment>(devices_->createAll(config.equipment.instruments));
    job.settings = config.equipment;
    if (!config.logDirectory.empty())
      job.logPath = logFileName(config.logDirectory, test.label);

    // nothing below can fail: the run is now claimed
    duts_ = std::move(duts);
    percent_ = 0;
    message_.clear();
    cancel_ = false;
    state_ = State::Initializing;
  }
  cv_.notify_all();

  std::function<void(State)> cb;
  {
    std::lock_guard lock(mtx_);
    cb = stateCallback_;
  }
  if (cb)
    cb(State::Initializing);

  errorMonitor_->reset();

  // the previous worker already reported Idle; it may still be unwinding
  if (worker_.joinable())
    worker_.join();
  worker_ = std::thread(&TestCoordinator::execute, this, std::move(job));
}

void TestCoordinator::stop() {
  std::function<void(State)> cb;
  {
    std::lock_guard lock(mtx_);
    if (state_ != State::Initializing && state_ != State::Running)
      return;
    cancel_ = true;
    state_ = State::Aborting;
    cb = stateCallback_;
  }
  cv_.notify_all();
  if (cb)
    cb(State::Aborting);
}

bool TestCoordinator::isBusy() const {
  std::lock_guard lock(mtx_);
  return state_ != State::Idle;
}

TestCoordinator::State TestCoordinator::state() const {
  std::lock_guard lock(mtx_);
  return state_;
}

int TestCoordinator::progress() const {
  std::lock_guard lock(mtx_);
  return percent_;
}

std::string TestCoordinator::lastMessage() const {
  std::lock_guard lock(mtx_);
  return message_;
}

std::vector<Dut> TestCoordinator::duts() const {
  std::lock_guard lock(mtx_);
  return duts_;
}

bool TestCoordinator::waitUntilIdle(std::chrono::milliseconds timeout) const {
  std::unique_lock lock(mtx_);
  return cv_.wait_for(lock, timeout, [this] { return state_ == State::Idle; });
}

void TestCoordinator::registerStateCallback(std::function<void(State)> cb) {
  std::lock_guard lock(mtx_);
  stateCallback_ = std::move(cb);
}

//------------------------------------------------------------------------------
//  worker thread
//------------------------------------------------------------------------------
void TestCoordinator::execute(Job job) {
  auto& equipment = *job.equipment;

  std::vector<Dut> work;
  {
    std::lock_guard lock(mtx_);
    work = duts_;
  }

  for (unsigned index : job.defaultedSerials)
    observer_->onDutSerialNumberChanged(index, work[index - 1].serialNumber);

  if (!job.logPath.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(job.logPath).parent_path(), ec);
    if (!logger_.startNewRun(job.logPath))
      std::cerr << "[TestCoordinator] run log " << job.logPath << " could not be opened\n";
  }

  bool setupDone = false;
  try {
    reportProgress(0, "Initializing equipment...");
    initialize(equipment, job.settings);
    setupDone = true;

    for (auto& dut : work) {
      if (dut.selected)
        setDutStatus(dut, DutStatus::Init);
    }

    enterRunning();
    job.protocol->run(equipment, work, job.plan, *this);
  } catch (const RunAborted&) {
    reportProgress(0, "Test aborted.");
  } catch (const DeviceError& e) {
    std::cerr << "[TestCoordinator] " << toString(e.kind()) << ": " << e.what() << '\n';
    failRun(work, e.what(), !setupDone);
  } catch (const std::exception& e) {
    std::cerr << "[TestCoordinator] " << e.what() << '\n';
    failRun(work, e.what(), !setupDone);
  }

  complete(equipment, setupDone);
}

void TestCoordinator::initialize(Equipment& equipment, const EquipmentSettings& settings) {
  equipment.open();
  equipment.selectGas(settings.gas);

  if (settings.dutSupplyVoltage) {
    auto* supply = equipment.supplyController();
    if (!supply)
      throw ConfigurationError("A DUT supply voltage is configured but no power supply is.");
    supply->writeValue(*settings.dutSupplyVoltage);
    supply->setControlMode(ControlMode::Active);
  }
}

void TestCoordinator::complete(Equipment& equipment, bool setupDone) {
  // A failed setup goes straight back to Idle; only a run that got past
  // setup, or one that was aborted, passes through Completing.
  if (setupDone || cancel_)
    transitionTo(State::Completing);

  if (setupDone) {
    for (auto* controller : equipment.controllers()) {
      try {
        controller->setControlMode(ControlMode::Passive);
      } catch (const DeviceError& e) {
        std::cerr << "[TestCoordinator] could not return to passive: " << e.what() << '\n';
      }
    }
  }

  for (const auto& error : equipment.close())
    std::cerr << "[TestCoordinator] close: " << error << '\n';

  if (logger_.running())
    logger_.finishRun();

  observer_->onFinished();
  transitionTo(State::Idle);
}

void TestCoordinator::failRun(std::vector<Dut>& duts, const std::string& reason,
                              bool everySelected) {
  for (auto& dut : duts) {
    if (!dut.selected)
      continue;
    const bool undecided = dut.status == DutStatus::Init || dut.status == DutStatus::Found;
    if (everySelected || undecided)
      setDutStatus(dut, DutStatus::PortError, reason);
  }
  errorMonitor_->notifyFailure(reason);
  reportProgress(0, "Test failed: " + reason);
}

void TestCoordinator::transitionTo(State next) {
  std::function<void(State)> cb;
  {
    std::lock_guard lock(mtx_);
    state_ = next;
    cb = stateCallback_;
  }
  if (cb)
    cb(next);
  cv_.notify_all();
}

void TestCoordinator::enterRunning() {
  std::function<void(State)> cb;
  {
    std::lock_guard lock(mtx_);
    if (cancel_)
      throw RunAborted();
    state_ = State::Running;
    cb = stateCallback_;
  }
  if (cb)
    cb(State::Running);
}

//------------------------------------------------------------------------------
//  RunControl
//------------------------------------------------------------------------------
void TestCoordinator::checkpoint() {
  if (cancel_)
    throw RunAborted();
}

void TestCoordinator::dwell(std::chrono::milliseconds duration) {
  {
    std::unique_lock lock(mtx_);
    cv_.wait_for(lock, duration, [this] { return cancel_.load(); });
  }
  checkpoint();
}

void TestCoordinator::reportProgress(int percent, const std::string& message) {
  int reported = 0;
  {
    std::lock_guard lock(mtx_);
    percent_ = std::max(percent_, std::clamp(percent, 0, 100));
    message_ = message;
    reported = percent_;
  }
  observer_->onProgress(reported, message);
}

void TestCoordinator::setDutStatus(Dut& dut, DutStatus status, const std::string& message) {
  dut.status = status;
  dut.message = message;
  {
    std::lock_guard lock(mtx_);
    if (dut.index >= 1 && dut.index <= duts_.size())
      duts_[dut.index - 1] = dut;
  }
  observer_->onDutStatusChanged(dut.index, status);
}

void TestCoordinator::record(const LogEvent& event) {
  if (logger_.running() && !logger_.log(event))
    errorMonitor_->notifyFailure("Run log is falling behind; rows were dropped.");
}

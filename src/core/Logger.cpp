/* @file Logger.cpp
 * @brief Background CSV writer fed through a RingBuffer.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <ctime>
#include <iostream>

// FlowCal headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"
#include "io/FileLogger.hpp"
#include "protocols/Response.hpp"

using namespace flowcal::core;

namespace {
  constexpr const char* kHeader = "timestamp,dut,serial,setpoint,reference,measured,result\n";

  std::string isoTime(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
  }
} // namespace

Logger::Logger() = default;

Logger::~Logger() { finishRun(); }

std::string Logger::toCsv(const LogEvent& e) {
  using flowcal::protocols::formatFixed;
  return isoTime(e.timestamp) + "," + std::to_string(e.dutIndex) + "," + e.serialNumber + "," +
         formatFixed(e.setpoint, 4) + "," + formatFixed(e.reference, 4) + "," +
         formatFixed(e.measured, 4) + "," + e.result + "\n";
}

bool Logger::startNewRun(const std::string& path) {
  finishRun();

  csvFile_ = std::make_unique<io::FileLogger>();
  if (!csvFile_->open(path)) {
    std::cerr << "[Logger] could not open run log " << path << "\n";
    csvFile_.reset();
    return false;
  }
  csvFile_->write(kHeader);

  buffer_ = std::make_unique<RingBuffer<LogEvent>>(kQueueDepth);
  running_ = true;
  worker_ = std::thread([this] { drain(); });
  return true;
}

bool Logger::log(const LogEvent& event) {
  if (!running_ || !buffer_)
    return false;
  if (!buffer_->push(event)) {
    std::cerr << "[Logger] queue full, dropped row for DUT " << event.dutIndex << "\n";
    return false;
  }
  return true;
}

void Logger::finishRun() {
  if (!worker_.joinable())
    return;
  running_ = false;
  worker_.join();

  if (csvFile_) {
    if (!csvFile_->flush())
      std::cerr << "[Logger] flush of run log failed\n";
    csvFile_->close();
    csvFile_.reset();
  }
  buffer_.reset();
}

// keeps draining until stopped and the queue is empty
void Logger::drain() {
  while (true) {
    auto event = buffer_->pop(std::chrono::milliseconds{ 50 });
    if (event) {
      csvFile_->write(toCsv(*event));
      continue;
    }
    if (!running_) {
      // rows pushed between the last timeout and the stop still belong to the run
      while (auto rest = buffer_->pop(std::chrono::milliseconds{ 0 }))
        csvFile_->write(toCsv(*rest));
      break;
    }
  }
}

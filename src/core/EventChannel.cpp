/* @file EventChannel.cpp
 * @brief Queue-backed RunObserver.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <iterator>
#include <utility>

#include "core/EventChannel.hpp"

using namespace flowcal::core;

void EventChannel::onProgress(int percent, const std::string& message) {
  RunEvent e;
  e.type = RunEvent::Type::Progress;
  e.percent = percent;
  e.text = message;
  push(std::move(e));
}

void EventChannel::onFinished() {
  RunEvent e;
  e.type = RunEvent::Type::Finished;
  push(std::move(e));
}

void EventChannel::onDutStatusChanged(unsigned dutIndex, DutStatus status) {
  RunEvent e;
  e.type = RunEvent::Type::DutStatus;
  e.dutIndex = dutIndex;
  e.status = status;
  push(std::move(e));
}

void EventChannel::onDutSerialNumberChanged(unsigned dutIndex, const std::string& serialNumber) {
  RunEvent e;
  e.type = RunEvent::Type::DutSerialNumber;
  e.dutIndex = dutIndex;
  e.text = serialNumber;
  push(std::move(e));
}

std::optional<RunEvent> EventChannel::next(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mtx_);
  if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); }))
    return std::nullopt;
  RunEvent e = std::move(queue_.front());
  queue_.pop_front();
  return e;
}

std::vector<RunEvent> EventChannel::drain() {
  std::lock_guard lock(mtx_);
  std::vector<RunEvent> out(std::make_move_iterator(queue_.begin()),
                            std::make_move_iterator(queue_.end()));
  queue_.clear();
  return out;
}

void EventChannel::push(RunEvent event) {
  {
    std::lock_guard lock(mtx_);
    queue_.push_back(std::move(event));
  }
  cv_.notify_one();
}

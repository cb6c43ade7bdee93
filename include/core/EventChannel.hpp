#pragma once
/** @file  EventChannel.hpp
 *  @brief RunObserver that queues structured events for another thread to drain.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/RunObserver.hpp"

namespace flowcal::core {

  struct RunEvent {
    enum class Type : std::uint8_t { Progress, DutStatus, DutSerialNumber, Finished };

    Type type{ Type::Progress };
    int percent{ 0 };
    std::string text; ///< progress message or serial number
    unsigned dutIndex{ 0 };
    DutStatus status{ DutStatus::Init };
  };

  /**
 * @class EventChannel
 * @brief Thread-safe hand-off from the run worker to a UI/CLI loop.
 *
 *  * The worker only enqueues; it never blocks on the consumer.
 *  * The consumer calls `next()` from whatever thread owns its widgets.
 */
  class EventChannel : public RunObserver {
  public:
    void onProgress(int percent, const std::string& message) override;
    void onFinished() override;
    void onDutStatusChanged(unsigned dutIndex, DutStatus status) override;
    void onDutSerialNumberChanged(unsigned dutIndex, const std::string& serialNumber) override;

    /// Waits up to \p timeout for the next event.
    std::optional<RunEvent> next(std::chrono::milliseconds timeout);

    /// Everything queued right now, without waiting.
    std::vector<RunEvent> drain();

  private:
    void push(RunEvent event);

    std::deque<RunEvent> queue_;
    std::mutex mtx_;
    std::condition_variable cv_;
  };

} // namespace flowcal::core

#pragma once
/** @file  RunObserver.hpp
 *  @brief Callbacks a UI (or any caller) receives while a run is active.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include "core/Dut.hpp"

namespace flowcal::core {

  /**
 * @class RunObserver
 * @brief Invoked from the run's worker thread, never the caller's.
 *
 *  Implementations marshal onto their own thread if they need to (see
 *  EventChannel). onFinished() fires exactly once per run, whatever the outcome.
 */
  class RunObserver {
  public:
    virtual ~RunObserver() = default;

    virtual void onProgress(int percent, const std::string& message) = 0;
    virtual void onFinished() = 0;
    virtual void onDutStatusChanged(unsigned dutIndex, DutStatus status) = 0;
    virtual void onDutSerialNumberChanged(unsigned dutIndex, const std::string& serialNumber) = 0;
  };

} // namespace flowcal::core

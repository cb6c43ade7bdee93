/* @file ErrorMonitor.cpp
 * @brief De-duplicating fault escalation.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <algorithm>

#include "core/ErrorMonitor.hpp"

namespace flowcal {
  namespace core {

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) {
      if (!rememberIfNew(message))
        return;

      std::function<void(const std::string&)> escalate;
      {
        std::lock_guard lock(mtx_);
        escalate = escalation_;
      }
      // called outside the lock so the callback may query failures()
      if (escalate)
        escalate(message);
    }

    void ErrorMonitor::reset() {
      std::lock_guard lock(mtx_);
      seen_.clear();
    }

    std::vector<std::string> ErrorMonitor::failures() const {
      std::lock_guard lock(mtx_);
      return seen_;
    }

    bool ErrorMonitor::rememberIfNew(const std::string& message) {
      std::lock_guard lock(mtx_);
      if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
        return false;
      seen_.push_back(message);
      return true;
    }

  } // namespace core
} // namespace flowcal

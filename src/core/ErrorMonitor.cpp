/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault sink with a single escalation hook
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// tvlink headers
#include "core/ErrorMonitor.hpp"

namespace tvlink {
  namespace core {

    ErrorMonitor::ErrorMonitor() = default;
    ErrorMonitor::~ErrorMonitor() = default;

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) {
      if (!recordIfNew(message))
        return;

      std::function<void(const std::string&)> escalate;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        escalate = escalation_;
      }
      // called unlocked so the escalation path may report further failures
      if (escalate)
        escalate(message);
    }

    std::vector<std::string> ErrorMonitor::failures() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_;
    }

    void ErrorMonitor::reset() {
      std::lock_guard<std::mutex> lock(mtx_);
      seen_.clear();
    }

    bool ErrorMonitor::recordIfNew(const std::string& message) {
      std::lock_guard<std::mutex> lock(mtx_);
      if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
        return false;
      seen_.push_back(message);
      return true;
    }

  } // namespace core
} // namespace tvlink

#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace tvlink::core {

  /**
 * @class ErrorMonitor
 * @brief Other threads call `notifyFailure()`; we call the registered
 *        escalation callback exactly once per unique error.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate failures so a stalled link doesn’t spam the escalation path.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor();
    virtual ~ErrorMonitor();

    /// Register a lambda that escalates a fault to the owning coordinator.
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by subsystems on fault; will forward to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    /// Distinct messages seen so far, in first-seen order.
    std::vector<std::string> failures() const;

    /// Forget every message so that a recurring fault escalates again.
    void reset();

  private:
    bool recordIfNew(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    mutable std::mutex mtx_;
  };

} // namespace tvlink::core

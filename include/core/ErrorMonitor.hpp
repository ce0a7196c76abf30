#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace petctl::core {

  /**
 * @class ErrorMonitor
 * @brief Components call `notifyFailure()` before throwing; we call the
 *        registered escalation callback exactly once per unique error.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate failures so a module retrying the same rejected gear
 *   every tick doesn't flood the log.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fault (usually into the run log).
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by components on fault; will forward to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    /// Forget every seen message so the next occurrence escalates again.
    void clear();

    std::size_t uniqueFailures() const;

  private:
    bool markSeen(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    mutable std::mutex mtx_;
  };

} // namespace petctl::core

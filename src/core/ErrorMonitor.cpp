/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault fan-out
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// PetCtl headers
#include "core/ErrorMonitor.hpp"

using namespace petctl::core;

void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
  std::lock_guard<std::mutex> lock(mtx_);
  escalation_ = std::move(cb);
}

void ErrorMonitor::notifyFailure(const std::string& message) {
  std::function<void(const std::string&)> cb;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!markSeen(message))
      return;
    cb = escalation_;
  }
  // call outside the lock, the escalation may log or re-enter
  if (cb)
    cb(message);
}

void ErrorMonitor::clear() {
  std::lock_guard<std::mutex> lock(mtx_);
  seen_.clear();
}

std::size_t ErrorMonitor::uniqueFailures() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return seen_.size();
}

bool ErrorMonitor::markSeen(const std::string& message) {
  if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
    return false;
  seen_.push_back(message);
  return true;
}

/* @file GearOverrideEngine.cpp
 * @brief gear override lease: validate on write, expire on read
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>
#include <string>

// PetCtl headers
#include "core/GearOverrideEngine.hpp"
#include "core/ItemNotEquippedError.hpp"
#include "core/Logger.hpp"

using namespace petctl::core;

namespace {
  constexpr const char* kSource = "GearOverrideEngine";
}

GearOverrideEngine::GearOverrideEngine(const GameState& game, const Clock& clock,
                                       std::chrono::milliseconds gracePeriod,
                                       std::shared_ptr<ErrorMonitor> errMonitor,
                                       std::shared_ptr<Logger> log)
    : game_(game), clock_(clock), gracePeriod_(gracePeriod),
      errorMonitor_(std::move(errMonitor)), log_(std::move(log)) {
  if (!errorMonitor_)
    throw std::invalid_argument("[GearOverrideEngine] error monitor is nullptr");
  if (gracePeriod_.count() < 0)
    throw std::invalid_argument("[GearOverrideEngine] grace period must be >= 0");
}

void GearOverrideEngine::setGear(std::optional<GearId> gear) {
  if (!gear) {
    std::lock_guard<std::mutex> lock(mtx_);
    expireLocked(); // a lapsed lease logs as expired, not released
    if (request_ && log_)
      log_->log(LogEvent::make(LogLevel::Info, kSource,
                               "override " + std::to_string(*request_) + " released"));
    request_.reset();
    return;
  }

  // validate before touching state: a rejected request is a no-op
  if (!hasGear(*gear)) {
    ItemNotEquippedError err(*gear);
    errorMonitor_->notifyFailure(err.what());
    throw err;
  }

  std::lock_guard<std::mutex> lock(mtx_);
  expireLocked();
  if (request_ != gear && log_)
    log_->log(LogEvent::make(LogLevel::Info, kSource, "override -> " + std::to_string(*gear)));
  request_ = gear;
  lastRequest_ = clock_.now();
}

std::optional<GearId> GearOverrideEngine::activeOverride() {
  std::lock_guard<std::mutex> lock(mtx_);
  expireLocked();
  return request_;
}

std::optional<GearId> GearOverrideEngine::effectiveGear(std::optional<GearId> userDefault) {
  if (auto active = activeOverride())
    return active;
  return userDefault;
}

bool GearOverrideEngine::hasGear(GearId gear) const {
  const auto equipped = game_.equippedGears();
  return std::find(equipped.begin(), equipped.end(), gear) != equipped.end();
}

void GearOverrideEngine::expireLocked() {
  if (!request_)
    return;
  const auto age = clock_.now() - lastRequest_;
  if (age <= gracePeriod_)
    return;

  if (log_) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(age).count();
    log_->log(LogEvent::make(LogLevel::Info, kSource,
                             "override " + std::to_string(*request_) + " expired after " +
                                 std::to_string(ms) + " ms"));
  }
  request_.reset();
}

#include "core/EnableArbiter.hpp"
#include "core/Logger.hpp"

using namespace petctl::core;

EnableArbiter::EnableArbiter(std::shared_ptr<Logger> log) : log_(std::move(log)) {}

void EnableArbiter::setEnabled(bool enabled) {
  const bool previous = enabled_.exchange(enabled);
  if (previous != enabled && log_)
    log_->log(LogEvent::make(LogLevel::Info, "EnableArbiter",
                             enabled ? "pet enabled by module" : "pet disabled by module"));
}

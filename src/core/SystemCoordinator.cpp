/* @file SystemCoordinator.cpp
 * @brief per-tick arbitration: module -> flags -> directive
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// PetCtl headers
#include "core/SystemCoordinator.hpp"
#include "core/ItemNotEquippedError.hpp"
#include "core/Logger.hpp"
#include "core/ModuleFactory.hpp"
#include "core/PetController.hpp"
#include "core/UserSettings.hpp"
#include "modules/BehaviorModule.hpp"

using namespace petctl::core;

namespace {
  constexpr const char* kSource = "SystemCoordinator";
}

SystemCoordinator::SystemCoordinator(PetController& pet, const UserSettings& settings,
                                     const ModuleFactory& factory, std::shared_ptr<Logger> log)
    : pet_(pet), settings_(settings), factory_(factory), log_(std::move(log)) {}

SystemCoordinator::~SystemCoordinator() = default;

void SystemCoordinator::start() {
  running_ = true;
  if (log_)
    log_->log(LogEvent::make(LogLevel::Info, kSource, "started"));
}

void SystemCoordinator::stop() {
  running_ = false;
  transitionTo(State::IDLE);
}

void SystemCoordinator::setModule(const std::string& name) {
  auto next = factory_.create(name); // throws before we drop the current one
  module_ = std::move(next);
  if (log_)
    log_->log(LogEvent::make(LogLevel::Info, kSource, "module -> " + module_->name()));
}

void SystemCoordinator::clearModule() { module_.reset(); }

std::string SystemCoordinator::activeModule() const { return module_ ? module_->name() : ""; }

PetDirective SystemCoordinator::tick() {
  if (running_ && module_) {
    try {
      module_->onTick(pet_);
    } catch (const ItemNotEquippedError& e) {
      // already escalated through ErrorMonitor; the module retries next tick
      if (log_)
        log_->log(LogEvent::make(LogLevel::Warn, module_->name(), e.what()));
    }
  }

  PetDirective directive;
  directive.deploy = running_ && pet_.isEnabled() && settings_.petEnabled();
  directive.gear = pet_.effectiveGear(settings_.defaultGear());
  directive.repair = directive.deploy && !pet_.isRepaired();

  if (!running_)
    transitionTo(State::IDLE);
  else
    transitionTo(directive.deploy ? State::OPERATING : State::DISABLED);
  return directive;
}

void SystemCoordinator::transitionTo(State next) {
  if (next == currentState_)
    return;
  if (log_)
    log_->log(LogEvent::make(LogLevel::Info, kSource,
                             std::string(toString(currentState_)) + " -> " + toString(next)));
  currentState_ = next;
}

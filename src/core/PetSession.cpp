#include <iostream>

#include "core/PetSession.hpp"

using namespace petctl::core;

PetSession::PetSession(const GameState& game, const Clock& clock, PetConfig cfg)
    : cfg_(std::move(cfg)), log_(std::make_shared<Logger>()),
      errorMonitor_(std::make_shared<ErrorMonitor>()), settings_(cfg_) {
  std::weak_ptr<Logger> weakLog = log_;
  errorMonitor_->registerEscalation([weakLog](const std::string& message) {
    if (auto log = weakLog.lock())
      log->log(LogEvent::make(LogLevel::Error, "ErrorMonitor", message));
  });

  pet_ = std::make_unique<PetController>(game, clock, cfg_, errorMonitor_, log_);
  coordinator_ = std::make_unique<SystemCoordinator>(*pet_, settings_, factory_, log_);
}

PetSession::~PetSession() { end(); }

void PetSession::begin() {
  errorMonitor_->clear();
  if (!log_->startNewRun(cfg_.logPath))
    std::cerr << "[PetSession] running without run log\n";
  coordinator_->start();
}

void PetSession::end() {
  if (coordinator_ && coordinator_->running())
    coordinator_->stop();
  log_->finishRun();
}

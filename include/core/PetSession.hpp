#pragma once
/** @file  PetSession.hpp
 *  @brief Owns every pet-control object for one automation run.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>

#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/ModuleFactory.hpp"
#include "core/PetConfig.hpp"
#include "core/PetController.hpp"
#include "core/SystemCoordinator.hpp"
#include "core/UserSettings.hpp"

namespace petctl::core {

  /**
 * @class PetSession
 * @brief Wiring: ErrorMonitor escalates into the run log, UserSettings is
 *        seeded from config, and the enable flag/gear lease live exactly as
 *        long as the session.
 *
 * The host registers its modules on `modules()` before `begin()`.
 */
  class PetSession {
  public:
    PetSession(const GameState& game, const Clock& clock, PetConfig cfg);
    ~PetSession(); ///< end()

    /// Open the run log and start the coordinator. Logging failure is not fatal.
    void begin();
    void end();

    PetController& pet() { return *pet_; }
    SystemCoordinator& coordinator() { return *coordinator_; }
    ModuleFactory& modules() { return factory_; }
    UserSettings& settings() { return settings_; }
    ErrorMonitor& errors() { return *errorMonitor_; }
    Logger& logger() { return *log_; }
    const PetConfig& config() const { return cfg_; }

    PetSession(const PetSession&) = delete;
    PetSession& operator=(const PetSession&) = delete;

  private:
    PetConfig cfg_;
    std::shared_ptr<Logger> log_;
    std::shared_ptr<ErrorMonitor> errorMonitor_;
    UserSettings settings_;
    ModuleFactory factory_;
    std::unique_ptr<PetController> pet_;
    std::unique_ptr<SystemCoordinator> coordinator_;
  };

} // namespace petctl::core

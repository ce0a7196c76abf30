#pragma once
/** @file  PetController.hpp
 *  @brief The pet API handed to behavior modules.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <memory>
#include <optional>

// PetCtl headers
#include "core/Clock.hpp"
#include "core/CooldownTracker.hpp"
#include "core/EnableArbiter.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/GameState.hpp"
#include "core/GearCatalog.hpp"
#include "core/GearOverrideEngine.hpp"
#include "core/LocatorFeed.hpp"
#include "core/PetConfig.hpp"
#include "core/PetTypes.hpp"

namespace petctl::core {

  class Logger;

  /**
 * @class PetController
 * @brief Facade over EnableArbiter, GearOverrideEngine, CooldownTracker and
 *        LocatorFeed, plus pass-through reads of the game state.
 *
 * Pet is deployed and auto-repaired only while `isEnabled()` is true, the user
 * has the pet switched on, and the host is running (see SystemCoordinator).
 */
  class PetController {
  public:
    PetController(const GameState& game, const Clock& clock, const PetConfig& cfg,
                  std::shared_ptr<ErrorMonitor> errMonitor,
                  std::shared_ptr<Logger> log = nullptr);

    //---enable flag (last writer wins)---------------------------------
    bool isEnabled() const { return arbiter_.isEnabled(); }

    /// Every module must call this each tick it runs.
    void setEnabled(bool enabled) { arbiter_.setEnabled(enabled); }

    //---pet status------------------------------------------------------
    bool isActive() const { return game_.petActive(); }
    bool isRepaired() const { return game_.petRepaired(); }
    int getRepairCount() const { return game_.repairCount(); }
    PetStat getStat(Stat stat) const { return game_.stat(stat); }

    //---gear------------------------------------------------------------
    bool hasGear(GearId gear) const { return gears_.hasGear(gear); }
    bool hasGear(const PetGear& gear) const { return hasGear(gear.id); }

    /// In-game gear; may lag one tick behind setGear().
    std::optional<PetGear> getGear() const;

    /**
     * Override the user's gear. Must be repeated every tick or it falls back
     * to the user choice once the grace period elapses. nullopt relinquishes.
     * @throws ItemNotEquippedError if \p gear is not equipped
     */
    void setGear(std::optional<GearId> gear) { gears_.setGear(gear); }
    void setGear(const PetGear& gear) { gears_.setGear(gear.id); }

    /// What was requested (not what the game shows), nullopt when in DEFAULT.
    std::optional<GearId> activeGearOverride() { return gears_.activeOverride(); }

    /// Override if live, else \p userDefault.
    std::optional<GearId> effectiveGear(std::optional<GearId> userDefault) {
      return gears_.effectiveGear(userDefault);
    }

    //---cooldowns-------------------------------------------------------
    bool hasCooldown(CooldownId cooldown) const { return cooldowns_.hasCooldown(cooldown); }
    bool hasCooldown(const PetGear& gear) const { return cooldowns_.hasCooldown(gear); }

    //---locator---------------------------------------------------------
    std::optional<Location> getLocatorNpcLoc() const { return locator_.ping(); }
    NpcList getLocatorNpcs() const { return locator_.npcs(); }

    LocatorFeed::SubscriptionId subscribeLocator(LocatorFeed::Listener listener) {
      return locator_.subscribe(std::move(listener));
    }

    /// Host-side ingestion entry point.
    LocatorFeed& locator() { return locator_; }

    const GearCatalog& catalog() const { return catalog_; }

  private:
    const GameState& game_;
    GearCatalog catalog_;
    EnableArbiter arbiter_;
    GearOverrideEngine gears_;
    CooldownTracker cooldowns_;
    LocatorFeed locator_;
  };

} // namespace petctl::core

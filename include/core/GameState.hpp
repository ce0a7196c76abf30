#pragma once
/** @file  GameState.hpp
 *  @brief Read-only view of live game state supplied by the automation host.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <vector>

// PetCtl headers
#include "core/PetTypes.hpp"

namespace petctl::core {

  /**
 * @class GameState
 * @brief Raw truth the control layer arbitrates over.
 *
 *  * Implemented by the host (memory reader, protocol client, ...).
 *  * Every call reflects "right now"; callers never cache results.
 */
  class GameState {
  public:
    virtual ~GameState() = default;

    /// Gear ids the hero currently has equipped for the pet.
    virtual std::vector<GearId> equippedGears() const = 0;

    /// Gear currently selected in-game, nullopt when the pet has none.
    virtual std::optional<GearId> currentGear() const = 0;

    virtual bool cooldownActive(CooldownId id) const = 0;
    virtual PetStat stat(Stat stat) const = 0;

    virtual bool petActive() const = 0;   ///< alive and on the map
    virtual bool petRepaired() const = 0;
    virtual int repairCount() const = 0;
  };

} // namespace petctl::core

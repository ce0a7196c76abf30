#pragma once
/** @file  CooldownTracker.hpp
 *  @brief Pass-through cooldown queries against live game state.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include "core/GameState.hpp"
#include "core/PetTypes.hpp"

namespace petctl::core {

  /// No cache, no TTL: every answer is "right now".
  class CooldownTracker {
  public:
    explicit CooldownTracker(const GameState& game) : game_(game) {}

    bool hasCooldown(CooldownId cooldown) const { return game_.cooldownActive(cooldown); }

    /// Gears without a cooldown mapping are never cooling down; game state isn't consulted.
    bool hasCooldown(const PetGear& gear) const {
      return gear.cooldown && hasCooldown(*gear.cooldown);
    }

  private:
    const GameState& game_;
  };

} // namespace petctl::core

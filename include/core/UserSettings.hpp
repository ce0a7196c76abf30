#pragma once
/** @file  UserSettings.hpp
 *  @brief Thread-safe live user preferences (pet switch, default gear).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <mutex>
#include <optional>

#include "core/PetConfig.hpp"
#include "core/PetTypes.hpp"

namespace petctl {
  namespace core {

    /** @class UserSettings
 *  @brief Lock-protected copy of the user-facing settings.
 *
 *  * Seeded from PetConfig, then toggled by the host UI at runtime.
 *  * Read by the coordinator every tick; modules never write here.
 */
    class UserSettings {

    public:
      UserSettings() = default;
      explicit UserSettings(const PetConfig& cfg)
          : petEnabled_(cfg.petEnabled), defaultGear_(cfg.defaultGear) {}

      bool petEnabled() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return petEnabled_;
      }

      void setPetEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx_);
        petEnabled_ = enabled;
      }

      std::optional<GearId> defaultGear() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return defaultGear_;
      }

      void setDefaultGear(std::optional<GearId> gear) {
        std::lock_guard<std::mutex> lock(mtx_);
        defaultGear_ = gear;
      }

    private:
      mutable std::mutex mtx_;
      bool petEnabled_{ false };
      std::optional<GearId> defaultGear_;
    };

  } // namespace core
} // namespace petctl

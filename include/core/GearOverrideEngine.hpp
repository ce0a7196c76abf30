#pragma once
/** @file  GearOverrideEngine.hpp
 *  @brief Module gear override held as a soft-state lease.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>

// PetCtl headers
#include "core/Clock.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/GameState.hpp"
#include "core/PetTypes.hpp"

namespace petctl {
  namespace core {

    class Logger;

    /**
 * @class GearOverrideEngine
 * @brief Holds the gear the active module asked for, as long as it keeps asking.
 *
 * States:
 *  - ACTIVE:  an override is stored and was refreshed within the grace period.
 *  - DEFAULT: no override (never set, relinquished with nullopt, or expired).
 *
 * Expiry is evaluated lazily on every read; there is no timer thread. The
 * check-then-clear runs under one lock so two readers can't race on it.
 */
    class GearOverrideEngine {
    public:
      GearOverrideEngine(const GameState& game, const Clock& clock,
                         std::chrono::milliseconds gracePeriod,
                         std::shared_ptr<ErrorMonitor> errMonitor,
                         std::shared_ptr<Logger> log = nullptr);

      /**
       * Request \p gear, or relinquish with nullopt.
       * @throws ItemNotEquippedError if the hero doesn't have \p gear equipped;
       *         the stored override is left untouched.
       */
      void setGear(std::optional<GearId> gear);

      /// The live override, or nullopt once relinquished/expired.
      std::optional<GearId> activeOverride();

      /// Override if live, otherwise \p userDefault.
      std::optional<GearId> effectiveGear(std::optional<GearId> userDefault);

      /// True if the hero has \p gear equipped right now.
      bool hasGear(GearId gear) const;

      std::chrono::milliseconds gracePeriod() const { return gracePeriod_; }

    private:
      void expireLocked(); ///< caller holds mtx_

      const GameState& game_;
      const Clock& clock_;
      const std::chrono::milliseconds gracePeriod_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<Logger> log_;

      mutable std::mutex mtx_;
      std::optional<GearId> request_;
      Clock::TimePoint lastRequest_{};
    };

  } // namespace core
} // namespace petctl

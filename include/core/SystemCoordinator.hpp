#pragma once

/** @file  SystemCoordinator.hpp
 *  @brief Host tick loop that turns module flags into pet directives.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <memory>
#include <optional>
#include <string>

#include "core/PetTypes.hpp"

namespace petctl::modules {
  class BehaviorModule;
}

namespace petctl {
  namespace core {

    class Logger;
    class ModuleFactory;
    class PetController;
    class UserSettings;

    /// What the host should do with the pet this tick.
    struct PetDirective {
      bool deploy{ false };
      std::optional<GearId> gear; ///< nullopt = leave the game's gear alone
      bool repair{ false };

      bool operator==(const PetDirective&) const = default;
    };

    class SystemCoordinator {

    public:
      enum class State { IDLE, DISABLED, OPERATING };

      SystemCoordinator(PetController& pet, const UserSettings& settings,
                        const ModuleFactory& factory, std::shared_ptr<Logger> log = nullptr);
      ~SystemCoordinator();

      void start(); ///< bot running; pet may be deployed from the next tick
      void stop();  ///< bot paused; every directive is "don't deploy"

      /// Swap the active module. Flags and gear lease are NOT reset.
      /// @throws std::out_of_range for unknown names
      void setModule(const std::string& name);
      void clearModule();

      /// Run the active module once, then resolve the directive.
      PetDirective tick();

      State state() const { return currentState_; }
      bool running() const { return running_; }
      std::string activeModule() const;

    private:
      void transitionTo(State next);

      PetController& pet_;
      const UserSettings& settings_;
      const ModuleFactory& factory_;
      std::shared_ptr<Logger> log_;

      std::unique_ptr<modules::BehaviorModule> module_;
      bool running_{ false };
      State currentState_{ State::IDLE };
    };

    inline const char* toString(SystemCoordinator::State s) {
      switch (s) {
      case SystemCoordinator::State::IDLE:
        return "IDLE";
      case SystemCoordinator::State::DISABLED:
        return "DISABLED";
      case SystemCoordinator::State::OPERATING:
        return "OPERATING";
      default:
        return "Unknown";
      }
    }

  } // namespace core
} // namespace petctl

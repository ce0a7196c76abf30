#pragma once
/** @file  BehaviorModule.hpp
 *  @brief Abstract base class for pluggable pet behaviors.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

namespace petctl::core { // forward decls only—keeps dependency light
  class PetController;
} // namespace petctl::core

namespace petctl::modules {

  /**
 * @class BehaviorModule
 * @brief Common polymorphic interface for every behavior (farming, escort, ...).
 *
 *  * Runs synchronously on the host tick thread.
 *  * Owns no game state—talks via PetController only.
 *  * Must re-declare its pet flag (and gear, if any) on every tick.
 */
  class BehaviorModule {
  public:
    virtual ~BehaviorModule() = default;

    virtual std::string name() const = 0;

    /**
     * @brief One decision cycle while this module is active.
     *
     * @param pet  Shared pet control surface.
     * @throws core::ItemNotEquippedError from setGear(); the coordinator logs it
     *         and keeps ticking.
     */
    virtual void onTick(core::PetController& pet) = 0;
  };

} // namespace petctl::modules

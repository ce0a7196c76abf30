#pragma once
/** @file  EnableArbiter.hpp
 *  @brief Last-writer-wins "pet enabled" flag shared by every behavior module.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <memory>

namespace petctl::core {

  class Logger;

  /**
 * @class EnableArbiter
 * @brief One flag for the whole run session; no per-module state.
 *
 *  * Modules must call `setEnabled()` every tick they run, otherwise they
 *    inherit whatever the previous module left behind.
 *  * The flag alone never deploys the pet: the coordinator also requires the
 *    user's own pet switch.
 */
  class EnableArbiter {
  public:
    explicit EnableArbiter(std::shared_ptr<Logger> log = nullptr);

    bool isEnabled() const { return enabled_.load(); }
    void setEnabled(bool enabled);

  private:
    std::atomic<bool> enabled_{ false };
    std::shared_ptr<Logger> log_;
  };

} // namespace petctl::core

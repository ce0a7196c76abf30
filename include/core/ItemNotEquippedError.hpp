#pragma once
/** @file  ItemNotEquippedError.hpp
 *  @brief Thrown when a gear override names a gear the hero doesn't have equipped.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <stdexcept>
#include <string>

#include "core/PetTypes.hpp"

namespace petctl::core {

  class ItemNotEquippedError : public std::runtime_error {
  public:
    explicit ItemNotEquippedError(GearId gear)
        : std::runtime_error("[GearOverrideEngine] gear " + std::to_string(gear) +
                             " is not equipped"),
          gear_(gear) {}

    GearId gear() const noexcept { return gear_; }

  private:
    GearId gear_;
  };

} // namespace petctl::core

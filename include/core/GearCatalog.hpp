#pragma once
/** @file  GearCatalog.hpp
 *  @brief Immutable id -> PetGear lookup built from configuration.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

#include "core/PetTypes.hpp"

namespace petctl {
  namespace core {

    class GearCatalog {
    public:
      GearCatalog() = default;

      /// @throws std::invalid_argument on duplicate gear id
      explicit GearCatalog(const std::vector<PetGear>& gears);

      std::optional<PetGear> find(GearId id) const;

      /// Known gear, or a bare PetGear{id} (no name, no cooldown) when unknown.
      PetGear resolve(GearId id) const;

      std::size_t size() const { return gears_.size(); }

    private:
      std::unordered_map<GearId, PetGear> gears_;
    };

  } // namespace core
} // namespace petctl

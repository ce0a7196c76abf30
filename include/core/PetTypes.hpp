#pragma once
/** @file  PetTypes.hpp
 *  @brief Value types shared by the pet control layer.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace petctl {
  namespace core {

    using GearId = std::int32_t;
    using CooldownId = std::int32_t;

    /**
 * @struct PetGear
 * @brief Reference data for one pet gear; immutable once built by GearCatalog.
 */
    struct PetGear {
      GearId id{ 0 };
      std::string name;
      std::optional<CooldownId> cooldown; ///< nullopt = gear never cools down

      bool operator==(const PetGear&) const = default;
    };

    enum class Stat : std::uint8_t { HP, SHIELD, FUEL, XP, HEAT, Count };
    static_assert(static_cast<std::uint8_t>(Stat::Count) == 5,
                  "Stat count changed please update code that depends on it");
    inline const char* toString(Stat s) {
      switch (s) {
      case Stat::HP:
        return "HP";
      case Stat::SHIELD:
        return "SHIELD";
      case Stat::FUEL:
        return "FUEL";
      case Stat::XP:
        return "XP";
      case Stat::HEAT:
        return "HEAT";
      default:
        return "Unknown";
      }
    }

    /// One stat as shown in the pet window. Recomputed on every read.
    struct PetStat {
      double current{ 0.0 };
      double total{ 0.0 };
    };

    struct Location {
      double x{ 0.0 };
      double y{ 0.0 };

      bool operator==(const Location&) const = default;
    };

    /// NPC listed by the pet locator. Identity is `id`; the other fields are cosmetic.
    struct NpcInfo {
      int id{ 0 };
      std::string name;
      double hp{ 0.0 };
      double shield{ 0.0 };
    };

    using NpcList = std::vector<NpcInfo>;

    /** Emitted by LocatorFeed when the set of NPC ids changes; carries the full new set. */
    struct LocatorNpcListChangeEvent {
      NpcList npcs;
    };

  } // namespace core
} // namespace petctl

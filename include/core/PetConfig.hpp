#pragma once
/** @file  PetConfig.hpp
 *  @brief Parsed run-time configuration.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "core/PetTypes.hpp"

namespace petctl::core {

  struct PetConfig {
    static constexpr std::chrono::milliseconds kDefaultGracePeriod{ 5000 };

    bool petEnabled{ false };               ///< user's own "use pet" switch
    std::optional<GearId> defaultGear;      ///< user's gear when no override is live
    std::chrono::milliseconds gearGracePeriod{ kDefaultGracePeriod };
    std::string logPath{ "pet_control.csv" };
    std::vector<PetGear> gears;             ///< reference data for GearCatalog
  };

} // namespace petctl::core

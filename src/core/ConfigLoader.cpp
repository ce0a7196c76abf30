/* @file ConfigLoader.cpp
 * @brief JSON -> PetConfig
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>

// 3rd-party headers
#include <nlohmann/json.hpp>

// PetCtl headers
#include "core/ConfigLoader.hpp"

using namespace petctl::core;
using nlohmann::json;

namespace {

  /// Integer field as T; fractions and values outside T's range are errors, not casts.
  template <typename T> T integerAs(const json& value, const char* key) {
    if (!value.is_number_integer())
      throw std::runtime_error(std::string("[ConfigLoader] ") + key + " must be an integer");

    constexpr auto lo = std::numeric_limits<T>::min();
    constexpr auto hi = std::numeric_limits<T>::max();
    if (value.is_number_unsigned()) {
      if (value.get<std::uint64_t>() > static_cast<std::uint64_t>(hi))
        throw std::runtime_error(std::string("[ConfigLoader] ") + key + " out of range");
    } else {
      const auto v = value.get<std::int64_t>();
      if (v < static_cast<std::int64_t>(lo) || v > static_cast<std::int64_t>(hi))
        throw std::runtime_error(std::string("[ConfigLoader] ") + key + " out of range");
    }
    return static_cast<T>(value.get<std::int64_t>());
  }

} // namespace

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

json ConfigLoader::loadJson() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);

  try {
    return json::parse(in);
  } catch (const json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
  }
}

PetConfig ConfigLoader::load() const { return parse(loadJson()); }

PetConfig ConfigLoader::parse(const json& doc) {
  PetConfig cfg;
  if (!doc.is_object())
    throw std::runtime_error("[ConfigLoader] top level must be an object");

  try {
    if (auto pet = doc.find("pet"); pet != doc.end()) {
      cfg.petEnabled = pet->value("enabled", cfg.petEnabled);
      cfg.logPath = pet->value("log_path", cfg.logPath);

      if (auto gear = pet->find("default_gear"); gear != pet->end() && !gear->is_null())
        cfg.defaultGear = integerAs<GearId>(*gear, "default_gear");

      if (auto grace = pet->find("gear_grace_period_ms"); grace != pet->end()) {
        const auto ms = integerAs<std::int64_t>(*grace, "gear_grace_period_ms");
        if (ms < 0)
          throw std::invalid_argument("[ConfigLoader] gear_grace_period_ms must be >= 0");
        cfg.gearGracePeriod = std::chrono::milliseconds{ ms };
      }
    }

    if (auto gears = doc.find("gears"); gears != doc.end()) {
      for (const auto& g : gears->get_ref<const json::array_t&>()) {
        PetGear gear;
        gear.id = integerAs<GearId>(g.at("id"), "gears[].id");
        gear.name = g.value("name", std::string{});
        if (auto cd = g.find("cooldown"); cd != g.end() && !cd->is_null())
          gear.cooldown = integerAs<CooldownId>(*cd, "gears[].cooldown");
        const bool dup = std::any_of(cfg.gears.begin(), cfg.gears.end(),
                                     [&](const PetGear& seen) { return seen.id == gear.id; });
        if (dup)
          throw std::invalid_argument("[ConfigLoader] duplicate gear id " +
                                      std::to_string(gear.id));
        cfg.gears.push_back(std::move(gear));
      }
    }
  } catch (const json::exception& e) {
    throw std::runtime_error(std::string("[ConfigLoader] ") + e.what());
  }

  return cfg;
}

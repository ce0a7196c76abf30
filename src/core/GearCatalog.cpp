#include <stdexcept>
#include <string>

#include "core/GearCatalog.hpp"

using namespace petctl::core;

GearCatalog::GearCatalog(const std::vector<PetGear>& gears) {
  for (const auto& g : gears) {
    if (!gears_.emplace(g.id, g).second)
      throw std::invalid_argument("[GearCatalog] duplicate gear id " + std::to_string(g.id));
  }
}

std::optional<PetGear> GearCatalog::find(GearId id) const {
  auto it = gears_.find(id);
  if (it == gears_.end())
    return std::nullopt;
  return it->second;
}

PetGear GearCatalog::resolve(GearId id) const {
  if (auto g = find(id))
    return *g;
  PetGear bare;
  bare.id = id;
  return bare;
}

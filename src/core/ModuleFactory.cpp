#include <algorithm>
#include <stdexcept>

#include "core/ModuleFactory.hpp"
#include "modules/BehaviorModule.hpp"

using namespace petctl::core;

bool ModuleFactory::registerModule(const std::string& name, Creator maker) {
  if (!maker)
    throw std::invalid_argument("[ModuleFactory] empty creator for " + name);
  return creators_.emplace(name, std::move(maker)).second;
}

std::unique_ptr<petctl::modules::BehaviorModule>
ModuleFactory::create(const std::string& name) const {
  auto it = creators_.find(name);
  if (it == creators_.end())
    throw std::out_of_range("[ModuleFactory] unknown module: " + name);
  auto module = it->second();
  if (!module)
    throw std::runtime_error("[ModuleFactory] creator for " + name + " returned nullptr");
  return module;
}

std::vector<std::string> ModuleFactory::names() const {
  std::vector<std::string> out;
  out.reserve(creators_.size());
  for (const auto& [name, creator] : creators_)
    out.push_back(name);
  std::sort(out.begin(), out.end());
  return out;
}

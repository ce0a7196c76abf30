#pragma once
/** @file  ModuleFactory.hpp
 *  @brief Runtime registry that maps behavior module names to creators.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace petctl::modules {
  class BehaviorModule;
}

namespace petctl::core {

  /**
 * @class ModuleFactory
 * @brief Register & instantiate behavior modules by string key.
 *
 *  * Keeps SystemCoordinator decoupled from concrete modules.
 *  * Creators are lambdas returning `unique_ptr<BehaviorModule>`.
 */
  class ModuleFactory {
  public:
    using Creator = std::function<std::unique_ptr<modules::BehaviorModule>()>;

    /// Register a module under \p name.  Returns false on duplicate.
    bool registerModule(const std::string& name, Creator maker);

    /// Create a fresh instance or throw `std::out_of_range` if unknown.
    std::unique_ptr<modules::BehaviorModule> create(const std::string& name) const;

    bool contains(const std::string& name) const { return creators_.count(name) > 0; }

    std::vector<std::string> names() const;

  private:
    std::unordered_map<std::string, Creator> creators_;
  };

} // namespace petctl::core

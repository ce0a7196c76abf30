#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration (JSON) from the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/PetConfig.hpp"

namespace petctl::core {

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and maps it onto PetConfig.
 *
 *  * No caching — every call to `load()` re-reads the file (cheap, tiny file).
 *  * Missing keys keep PetConfig defaults; wrong types are errors.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json loadJson() const;

    /// loadJson() + parse().
    PetConfig load() const;

    /// Map a parsed document onto PetConfig.
    /// @throws std::runtime_error on type mismatch, std::invalid_argument on bad values
    static PetConfig parse(const nlohmann::json& doc);

  private:
    std::string path_;
  };

} // namespace petctl::core

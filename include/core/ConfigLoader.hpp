#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration (JSON) from the host FS.
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/HotspotConfig.hpp"

namespace hotspot::core {

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and maps it onto HotspotConfig.
 *
 *  * No caching — every call to `load()` re-reads the file (cheap, tiny file).
 *  * Every key is optional; absent keys keep the HotspotConfig defaults.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    /// `fromJson(load())`
    HotspotConfig loadConfig() const;

    /// Map @p doc onto defaults; bad types or ranges throw `std::invalid_argument`.
    static HotspotConfig fromJson(const nlohmann::json& doc);

    static RadioCyclePolicy parsePolicy(const std::string& name);
    static Severity parseSeverity(const std::string& name);

  private:
    std::string path_;
  };

} // namespace hotspot::core

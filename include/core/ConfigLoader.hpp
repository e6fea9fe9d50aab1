#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads deployment settings (JSON) from the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

// 3rd-party headers
#include <nlohmann/json_fwd.hpp>

namespace keel::core {

  struct DeploySettings;

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to
 *        the caller.
 *
 *  * No caching — every call to `load()` re-reads the file (cheap, tiny file).
 *  * Field validation lives in DeploySettings::applyJson().
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `ConfigError`.
    nlohmann::json load() const;

    /// Defaults overlaid with the file's contents.
    DeploySettings loadSettings() const;

  private:
    std::string path_;
  };

} // namespace keel::core

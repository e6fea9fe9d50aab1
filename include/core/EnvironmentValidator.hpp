#pragma once
/** @file  EnvironmentValidator.hpp
 *  @brief Preflight checks run before anything touches the container runtime.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>
#include <vector>

#include "core/ConfigSource.hpp"
#include "core/DeploySettings.hpp"
#include "core/DeploymentTypes.hpp"

namespace keel {
  namespace io {
    class HostEnvironment;
  } // namespace io

  namespace core {

    /**
 * @class EnvironmentValidator
 * @brief Produces a PreflightResult, never mutates host or config.
 *
 *  Order: platform, config-file, tools, group, required keys.
 *  * Group membership only ever WARNs.
 *  * Every required key is checked before returning, so the operator sees
 *    all missing keys at once.
 */
    class EnvironmentValidator {
    public:
      EnvironmentValidator(const io::HostEnvironment& host, const DeploySettings& settings);

      /// @param config  parsed env file, nullptr when it could not be loaded.
      PreflightResult run(const ConfigSource* config) const;

      CheckResult checkPlatform() const;
      CheckResult checkConfigFile() const;
      std::vector<CheckResult> checkTools() const;
      CheckResult checkGroup() const;
      std::vector<CheckResult> checkKeys(const ConfigSource* config) const;

      /// Per-key sentinel match, or the generic "your-...-here" template shape.
      static bool isPlaceholder(const std::string& value, const RequiredKey& key);

    private:
      const io::HostEnvironment& host_;
      const DeploySettings& settings_;
    };

  } // namespace core
} // namespace keel

#pragma once
/** @file  DeploySettings.hpp
 *  @brief Static description of the stack being deployed and the run policy.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <string>
#include <vector>

// 3rd-party headers
#include <nlohmann/json_fwd.hpp>

namespace keel::core {

  /// Upper bound for any configured wait or command timeout.
  inline constexpr std::chrono::seconds kMaxDuration{ 24 * 60 * 60 };

  /// A configuration key that must be set, plus the template value it ships with.
  struct RequiredKey {
    std::string name;
    std::string placeholder; ///< empty = only the generic "your-...-here" rule applies
    std::string hint;        ///< what the value is, shown when missing
  };

  /// Endpoint printed in the final summary.
  struct ServiceEndpoint {
    std::string label;
    std::string location;
  };

  /**
 * @struct HealthPolicy
 * @brief Timing knobs for HealthVerifier.
 *
 *  * All waits use a fixed interval, never exponential.
 */
  struct HealthPolicy {
    std::string url{ "http://localhost:8000/" };
    std::chrono::milliseconds settleWindow{ 30'000 };  ///< max wait for a "running" service
    std::chrono::milliseconds pollInterval{ 2'000 };   ///< fixed backoff between attempts
    std::chrono::milliseconds maxWait{ 90'000 };       ///< overall budget for verification
    std::chrono::milliseconds probeTimeout{ 5'000 };   ///< per HTTP attempt
  };

  /**
 * @struct DeploySettings
 * @brief Everything the orchestrator needs to know about the stack.
 *
 *  * Defaults describe the document-processing stack (API + SQS worker +
 *    cross-validation watcher).
 *  * `applyJson()` overrides only the fields present in a settings file.
 */
  struct DeploySettings {
    std::string stackName{ "lendingwise" };
    std::string projectDir{ "." };
    std::string envFile{ ".env" };
    std::string envExample{ ".env.example" };
    std::string expectedOs{ "Linux" };
    std::string runtimeGroup{ "docker" };
    std::vector<std::string> requiredTools{ "docker" };
    std::vector<RequiredKey> requiredKeys;
    std::vector<std::string> directories;
    std::vector<std::string> legacyContainers;
    std::vector<ServiceEndpoint> endpoints;
    HealthPolicy health;
    std::size_t logTailLines{ 50 };
    std::chrono::milliseconds commandTimeout{ 30 * 60 * 1000 }; ///< build can be slow

    /// Built-in description of the stack.
    static DeploySettings defaults();

    /// Overlay \p j on top of this; throws ConfigError on wrong types or
    /// durations outside [0, kMaxDuration] (poll interval must be non-zero).
    void applyJson(const nlohmann::json& j);

    /// Path of the env file relative to the working directory.
    std::string envFilePath() const;
  };

} // namespace keel::core

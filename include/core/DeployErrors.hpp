#pragma once
/** @file  DeployErrors.hpp
 *  @brief Exception taxonomy used at stage boundaries.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

// Keel headers
#include "core/DeploymentTypes.hpp"

namespace keel::core {

  /// Settings file missing, unparsable or holding wrong types.
  class ConfigError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  /// Raised when one or more preflight checks FAIL.
  class PreflightError : public std::runtime_error {
  public:
    explicit PreflightError(PreflightResult result)
        : std::runtime_error(std::to_string(result.count(CheckStatus::Fail)) +
                             " preflight check(s) failed"),
          result_(std::move(result)) {}

    const PreflightResult& result() const noexcept { return result_; }

  private:
    PreflightResult result_;
  };

  /// Output directory could not be created.
  class BootstrapError : public std::runtime_error {
  public:
    BootstrapError(std::string path, const std::string& what)
        : std::runtime_error("cannot prepare directory '" + path + "': " + what),
          path_(std::move(path)) {}

    const std::string& path() const noexcept { return path_; }

  private:
    std::string path_;
  };

  /// A compose call could not run or returned an error.
  class LifecycleError : public std::runtime_error {
  public:
    LifecycleError(LifecycleStage stage, const std::string& what, std::string output = {})
        : std::runtime_error(std::string("[") + toString(stage) + "] " + what), stage_(stage),
          output_(std::move(output)) {}

    LifecycleStage stage() const noexcept { return stage_; }
    const std::string& output() const noexcept { return output_; }

  private:
    LifecycleStage stage_;
    std::string output_;
  };

  /// Deployment came up but did not prove healthy.
  class HealthError : public std::runtime_error {
  public:
    HealthError(HealthStatus status, const std::string& what)
        : std::runtime_error(what), status_(status) {}

    HealthStatus status() const noexcept { return status_; }

  private:
    HealthStatus status_;
  };

} // namespace keel::core

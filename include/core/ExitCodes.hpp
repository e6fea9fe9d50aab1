#pragma once
/** @file  ExitCodes.hpp
 *  @brief Process exit contract of the `keel` CLI.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

namespace keel::core {

  /// Process exit status of one `keel` run.
  enum class ExitCode : int {
    kSuccess = 0, ///< healthy deployment or operator decline
    kFailure = 1, ///< preflight, bootstrap, build/start, unhealthy, timed out
    kUsage = 2,
  };

  constexpr int toInt(ExitCode code) { return static_cast<int>(code); }

} // namespace keel::core

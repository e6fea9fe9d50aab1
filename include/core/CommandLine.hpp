#pragma once
/** @file  CommandLine.hpp
 *  @brief Argument parsing for the `keel` CLI.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace keel::core {

  struct CliOptions {
    bool assumeYes{ false };
    bool verbose{ false };
    bool help{ false };
    std::optional<std::string> projectDir;
    std::optional<std::string> settingsPath;
    std::optional<long> timeoutSeconds; ///< 1 .. kMaxDuration
  };

  void usage(std::ostream& os);

  /**
   * @brief Parse the arguments after argv[0].
   * @returns std::nullopt on a usage error, after printing the reason to \p err.
   */
  std::optional<CliOptions> parseArgs(const std::vector<std::string>& args, std::ostream& err);

} // namespace keel::core

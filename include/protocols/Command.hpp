#pragma once
/** @file  Command.hpp
 *  @brief Compose CLI invocation builder with toArgv.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>
#include <vector>

namespace keel {
  namespace protocols {

    /// Which compose front-end the host provides.
    enum class ComposeFlavor { Plugin, Legacy }; ///< `docker compose` vs `docker-compose`

    /**
 * @struct Command
 * @brief One compose sub-command scoped to a project name.
 *
 *  * `toArgv()` yields the exact argv handed to ProcessRunner.
 */
    struct Command {
      ComposeFlavor flavor{ ComposeFlavor::Plugin };
      std::string project;          ///< -p <project>
      std::string verb;             ///< down, build, up, ps, logs, ...
      std::vector<std::string> args; ///< verb arguments

      std::vector<std::string> toArgv() const {
        std::vector<std::string> argv;
        if (flavor == ComposeFlavor::Plugin) {
          argv = { "docker", "compose" };
        } else {
          argv = { "docker-compose" };
        }
        if (!project.empty()) {
          argv.push_back("-p");
          argv.push_back(project);
        }
        argv.push_back(verb);
        argv.insert(argv.end(), args.begin(), args.end());
        return argv;
      }

      std::string toString() const {
        std::string out;
        for (const auto& a : toArgv()) {
          if (!out.empty())
            out += ' ';
          out += a;
        }
        return out;
      }
    };

  } // namespace protocols
} // namespace keel

/* @file CommandLine.cpp
 * @brief `keel [deploy] [options]` parsing
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstdlib>
#include <ostream>

// Keel headers
#include "core/CommandLine.hpp"
#include "core/DeploySettings.hpp"

namespace keel::core {

  void usage(std::ostream& os) {
    os << "usage: keel [deploy] [options]\n"
          "\n"
          "Validate the host, stop the previous stack, build and start it,\n"
          "then wait until it answers its health endpoint.\n"
          "\n"
          "options:\n"
          "  -y, --yes                 do not ask for confirmation\n"
          "  -C, --project-dir DIR     directory holding the compose file and .env\n"
          "  -s, --settings FILE       JSON settings overriding the built-in stack description\n"
          "  -t, --timeout SECONDS     maximum time to wait for the stack to become healthy\n"
          "  -v, --verbose             echo debug log lines to stderr\n"
          "  -h, --help                show this help\n";
  }

  std::optional<CliOptions> parseArgs(const std::vector<std::string>& args, std::ostream& err) {
    CliOptions opts;
    bool sawCommand = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
      const std::string& arg = args[i];
      auto value = [&](const char* flag) -> std::optional<std::string> {
        if (i + 1 >= args.size()) {
          err << "keel: " << flag << " needs a value\n";
          return std::nullopt;
        }
        return args[++i];
      };

      if (arg == "-y" || arg == "--yes") {
        opts.assumeYes = true;
      } else if (arg == "-v" || arg == "--verbose") {
        opts.verbose = true;
      } else if (arg == "-h" || arg == "--help") {
        opts.help = true;
      } else if (arg == "-C" || arg == "--project-dir") {
        if (!(opts.projectDir = value("--project-dir")))
          return std::nullopt;
      } else if (arg == "-s" || arg == "--settings") {
        if (!(opts.settingsPath = value("--settings")))
          return std::nullopt;
      } else if (arg == "-t" || arg == "--timeout") {
        auto v = value("--timeout");
        if (!v)
          return std::nullopt;
        char* end = nullptr;
        errno = 0;
        long secs = std::strtol(v->c_str(), &end, 10);
        if (end == v->c_str() || *end != '\0' || errno == ERANGE || secs <= 0 ||
            secs > kMaxDuration.count()) {
          err << "keel: --timeout expects 1 to " << kMaxDuration.count() << " seconds, got '"
              << *v << "'\n";
          return std::nullopt;
        }
        opts.timeoutSeconds = secs;
      } else if (arg == "deploy" && !sawCommand) {
        sawCommand = true;
      } else {
        err << "keel: unknown argument '" << arg << "'\n";
        return std::nullopt;
      }
    }
    return opts;
  }

} // namespace keel::core

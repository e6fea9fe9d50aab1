#pragma once
/** @file  Response.hpp
 *  @brief Per-service status as reported by `compose ps --format json`, with fromWire.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>
#include <vector>

namespace keel {
  namespace protocols {

    struct ServiceStatus {
      std::string service; ///< compose service name
      std::string name;    ///< container name
      std::string state;   ///< running, exited, restarting, created, dead, paused
      int exitCode{ 0 };

      bool running() const { return state == "running"; }
    };

    /**
 * @struct Response
 * @brief Parsed `ps` listing.
 *
 *  * Accepts a JSON array (compose v2.0 - v2.20) or one object per line
 *    (v2.21+).
 *  * Returns std::nullopt when the text is not JSON at all.
 */
    struct Response {
      std::vector<ServiceStatus> services;

      static std::optional<Response> fromWire(const std::string& text);

      std::size_t runningCount() const {
        std::size_t n = 0;
        for (const auto& s : services)
          if (s.running())
            ++n;
        return n;
      }
    };

  } // namespace protocols
} // namespace keel

#pragma once
/** @file  HostEnvironment.hpp
 *  @brief Read-only queries about the machine the stack is deployed on.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>

namespace keel {
  namespace io {

    class ProcessRunner;

    enum class FileAccess { Missing, Unreadable, Readable };

    /**
 * @class HostEnvironment
 * @brief Platform, file, PATH and group lookups behind virtuals so tests can
 *        fake a host.
 *
 *  * Nothing here mutates the host.
 */
    class HostEnvironment {
    public:
      explicit HostEnvironment(ProcessRunner& runner) : runner_(&runner) {}
      virtual ~HostEnvironment() = default;

      /// `uname -s` equivalent, e.g. "Linux".
      virtual std::string osFamily() const;

      virtual FileAccess fileAccess(const std::string& path) const;

      /// Full path of \p name on $PATH, or std::nullopt.
      virtual std::optional<std::string> findExecutable(const std::string& name) const;

      /// True when the effective user is root or belongs to \p group.
      virtual bool inGroup(const std::string& group) const;

      /// `docker compose` plugin or legacy `docker-compose` answers `version`.
      virtual bool composeAvailable() const;

    protected:
      HostEnvironment() = default; ///< for fakes

    private:
      ProcessRunner* runner_{ nullptr };
    };

  } // namespace io
} // namespace keel

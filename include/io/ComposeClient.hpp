#pragma once
/** @file  ComposeClient.hpp
 *  @brief Container-orchestration interface (down/build/up/ps/logs) and its
 *         docker compose implementation.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

// Keel headers
#include "io/ProcessRunner.hpp"
#include "protocols/Command.hpp"
#include "protocols/Response.hpp"

namespace keel {
  namespace io {

    struct ComposeResult {
      bool ok{ false };
      bool nothingToDo{ false }; ///< e.g. `down` found no containers
      int exitCode{ -1 };
      std::string output;
    };

    /**
 * @class ComposeClient
 * @brief Everything the orchestrator asks of the container runtime.
 *
 *  * Implementations serialise operations on the same stack themselves.
 *  * Never throws for a non-zero exit; that is reported in ComposeResult.
 */
    class ComposeClient {
    public:
      virtual ~ComposeClient() = default;

      virtual ComposeResult down(const std::string& stack) = 0;
      virtual ComposeResult build(const std::string& stack) = 0;
      virtual ComposeResult up(const std::string& stack, bool detached) = 0;
      /// std::nullopt when the listing could not be obtained or parsed.
      virtual std::optional<protocols::Response> ps(const std::string& stack) = 0;
      virtual std::string logs(const std::string& stack, std::size_t tail) = 0;
      /// Force-remove a single container by name (`docker rm -f`).
      virtual ComposeResult removeContainer(const std::string& name) = 0;
    };

    /**
 * @class DockerCompose
 * @brief ComposeClient backed by the `docker compose` / `docker-compose` CLI.
 */
    class DockerCompose : public ComposeClient {
    public:
      DockerCompose(ProcessRunner& runner, std::string projectDir, protocols::ComposeFlavor flavor,
                    std::chrono::milliseconds timeout);

      /// Probe which front-end is installed; std::nullopt if neither runs.
      static std::optional<protocols::ComposeFlavor> detectFlavor(ProcessRunner& runner);

      ComposeResult down(const std::string& stack) override;
      ComposeResult build(const std::string& stack) override;
      ComposeResult up(const std::string& stack, bool detached) override;
      std::optional<protocols::Response> ps(const std::string& stack) override;
      std::string logs(const std::string& stack, std::size_t tail) override;
      ComposeResult removeContainer(const std::string& name) override;

    private:
      ComposeResult exec(const protocols::Command& cmd, std::chrono::milliseconds timeout);
      protocols::Command command(const std::string& stack, std::string verb) const;

      static constexpr std::chrono::milliseconds kQueryTimeout{ 30'000 };

      ProcessRunner& runner_;
      std::string projectDir_;
      protocols::ComposeFlavor flavor_;
      std::chrono::milliseconds timeout_;
    };

  } // namespace io
} // namespace keel

#pragma once
/** @file  ProcessRunner.hpp
 *  @brief Synchronous fork/exec wrapper that captures combined stdout/stderr.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <string>
#include <vector>

namespace keel {
  namespace io {

    /// Result of one child process.
    struct ProcessResult {
      int exitCode{ -1 };  ///< -1 when the child did not exit normally
      bool timedOut{ false };
      std::string output;  ///< interleaved stdout + stderr

      bool ok() const { return exitCode == 0 && !timedOut; }
    };

    /**
 * @class ProcessRunner
 * @brief Runs an argv vector (no shell), waits with a deadline.
 *
 *  * Child gets its own pipe for stdout+stderr, stdin is /dev/null.
 *  * On deadline the child is SIGKILLed and reaped.
 *  * Throws `std::system_error` if the pipe or fork itself fails.
 */
    class ProcessRunner {

    public:
      ProcessRunner() = default;
      virtual ~ProcessRunner() = default;

      //---public API-------------------------------------------
      virtual ProcessResult run(const std::vector<std::string>& argv,
                                std::chrono::milliseconds timeout,
                                const std::string& workDir = {});

      //---non-copyable-----------------------------------------
      ProcessRunner(const ProcessRunner&) = delete;
      ProcessRunner& operator=(const ProcessRunner&) = delete;

    private:
      static constexpr int kExecFailed = 127; ///< same code a shell uses for "not found"
    };

  } // namespace io
} // namespace keel

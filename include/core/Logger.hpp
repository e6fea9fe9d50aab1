#pragma once
/** @file  Logger.hpp
 *  @brief Per-run CSV deployment log (file) with a stderr echo.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>

namespace keel {
  namespace io {
    class FileLogger;
  } // namespace io

  namespace core {

    enum class LogLevel : std::uint8_t { Debug, Info, Warn, Error };

    const char* toString(LogLevel level);

    struct LogEvent {
      LogLevel level{ LogLevel::Info };
      std::string component; ///< e.g. "Validator", "Lifecycle"
      std::string message;
    };

    /**
 * @class Logger
 * @brief One CSV line per event: `time,level,component,message`.
 *
 *  * File output is optional; without `startNewRun()` events only echo.
 *  * Events at or above the console level are echoed to the echo stream.
 *  * Thread-safe (single mutex), although a run is single-threaded.
 */
    class Logger {

    public:
      Logger();
      explicit Logger(std::ostream& echo);
      ~Logger();

      // --- public API ---
      bool startNewRun(const std::string& path); ///< open (append) the run log
      void log(const LogEvent& event);
      void finishRun(); ///< flush + close

      void setConsoleLevel(LogLevel level);

      void debug(const std::string& component, const std::string& msg) {
        log({ LogLevel::Debug, component, msg });
      }
      void info(const std::string& component, const std::string& msg) {
        log({ LogLevel::Info, component, msg });
      }
      void warn(const std::string& component, const std::string& msg) {
        log({ LogLevel::Warn, component, msg });
      }
      void error(const std::string& component, const std::string& msg) {
        log({ LogLevel::Error, component, msg });
      }

    private:
      std::unique_ptr<io::FileLogger> file_;
      std::ostream* echo_{ nullptr };
      LogLevel consoleLevel_{ LogLevel::Warn };
      std::mutex mtx_;
    };

  } // namespace core
} // namespace keel

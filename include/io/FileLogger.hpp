#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered line writer for the deployment log on the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace keel {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file in append mode, buffers writes, and
 *        flushes on demand.
 *
 *  * Buffer is drained with `std::fwrite` once it passes 4 kB.
 */
    class FileLogger {
    public:
      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. */
      bool open(const std::string& path);

      /** Queues one line (caller includes trailing '\n'). */
      void write(const std::string& line);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      bool isOpen() const { return fp_ != nullptr; }

      //---non-copyable-----------------------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;

    private:
      static constexpr std::size_t kChunk = 4096;

      std::FILE* fp_{ nullptr };
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace keel

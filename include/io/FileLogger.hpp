#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered append-mode writer for the toggle log file.
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace hotspot {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file, buffers writes, and flushes on demand.
 *
 *  * Appends; an existing log is never truncated.
 *  * Buffer is pushed with `std::fwrite` once it passes 4 kB.
 */
    class FileLogger {
    public:
      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. */
      bool open(const std::string& path);

      /** Queues one line (caller includes trailing '\n'). Throws if not open. */
      void write(const std::string& line);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      bool isOpen() const { return fp_ != nullptr; }

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      static constexpr std::size_t kFlushThreshold = 4096;

      FILE* fp_{ nullptr };
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace hotspot

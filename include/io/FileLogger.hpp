#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered CSV writer for the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace petctl {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file, buffers writes, and flushes on demand.
 *
 *  * Buffer is flushed with `std::fwrite` once it passes 4 kB.
 *  * Only the Logger worker writes; no internal locking.
 */
    class FileLogger {
    public:
      static constexpr std::size_t kChunkSize = 4096;

      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. Truncates. */
      bool open(const std::string& path);

      /** Queues one CSV line (caller includes trailing '\n'). */
      void write(const std::string& csv);

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
      FILE* fp_{ nullptr };
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace petctl

#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered CSV writer for the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

namespace labcell {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file, buffers writes, and flushes on demand.
 *
 *  * Intended for run logs (a few kB per protocol run).
 *  * Uses `std::fwrite` once the buffer reaches 4 kB.
 */
    class FileLogger {
    public:
      static constexpr std::size_t kChunkSize = 4096;

      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable (truncates). */
      bool open(const std::string& path);

      bool isOpen() const { return fp_ != nullptr; }

      /** Queues one CSV line (caller includes trailing '\n'). Returns false if closed or on EIO. */
      bool write(const std::string& csv);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      /** Flush + fclose. @returns false if buffered data did not reach the file. */
      bool close();

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
} // namespace labcell

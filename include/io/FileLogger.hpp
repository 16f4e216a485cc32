#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered append-only line writer for the clone history file.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdio>
#include <string>
#include <vector>

namespace cloneflow {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file for append, buffers lines, and flushes on demand.
 *
 *  * Lines accumulate in memory until `flush()` or the buffer passes 4 kB.
 *  * `close()` flushes; the destructor closes and drops any late write error.
 */
    class FileLogger {
    public:
      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened for append. */
      bool open(const std::string& path);

      bool isOpen() const { return fp_ != nullptr; }

      /** Queues one line (caller includes trailing '\n'); false if a spill to disk failed. */
      bool write(const std::string& line);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      /** Flush + fclose; false if either failed. */
      bool close();

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      static constexpr std::size_t kSpillBytes = 4096;

      std::FILE* fp_{ nullptr };
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace cloneflow

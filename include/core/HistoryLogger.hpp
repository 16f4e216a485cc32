#pragma once
/** @file  HistoryLogger.hpp
 *  @brief Appends finished clone runs to a CSV history file.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <mutex>
#include <string>

#include "io/FileLogger.hpp"
#include "protocols/CardTypes.hpp"

namespace cloneflow {
  namespace core {

    /**
 * @class HistoryLogger
 * @brief One CSV line per CloneRecord; the header is written when the file is new.
 *
 *  * Each record is flushed before `record()` returns.
 *  * `record()` throws std::runtime_error when the file cannot be written;
 *    callers treat history as best effort.
 */
    class HistoryLogger {
    public:
      explicit HistoryLogger(std::string path);
      virtual ~HistoryLogger() = default;

      // --- public API ---
      virtual void record(const protocols::CloneRecord& rec);

      const std::string& path() const { return path_; }

      static constexpr const char* kHeader =
          "timestamp,source_type,source_uid,target_type,target_uid,port,success,notes\n";

      /// RFC 4180 quoting: fields with a comma, quote or newline are quoted, quotes doubled.
      static std::string csvField(const std::string& value);
      static std::string csvLine(const protocols::CloneRecord& rec);

    private:
      std::string path_;
      io::FileLogger file_;
      std::mutex mtx_;
    };

  } // namespace core
} // namespace cloneflow

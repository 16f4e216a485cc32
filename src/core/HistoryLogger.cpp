/* @file HistoryLogger.cpp
 * @brief CSV encoding of clone records
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <filesystem>
#include <stdexcept>
#include <system_error>

// cloneflow headers
#include "core/HistoryLogger.hpp"

using namespace cloneflow::core;

HistoryLogger::HistoryLogger(std::string path) : path_(std::move(path)) {}

std::string HistoryLogger::csvField(const std::string& value) {
  if (value.find_first_of(",\"\r\n") == std::string::npos)
    return value;
  std::string quoted{ '"' };
  for (char c : value) {
    if (c == '"')
      quoted += '"';
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

std::string HistoryLogger::csvLine(const protocols::CloneRecord& rec) {
  std::string line;
  line += csvField(rec.timestamp) + ',';
  line += csvField(rec.sourceType) + ',';
  line += csvField(rec.sourceUid) + ',';
  line += csvField(rec.targetType) + ',';
  line += csvField(rec.targetUid) + ',';
  line += csvField(rec.port) + ',';
  line += rec.success ? "true," : "false,";
  line += csvField(rec.notes.value_or(""));
  line += '\n';
  return line;
}

void HistoryLogger::record(const protocols::CloneRecord& rec) {
  std::lock_guard<std::mutex> lock(mtx_);

  if (!file_.isOpen()) {
    std::error_code ec;
    const bool fresh = !std::filesystem::exists(path_, ec) || std::filesystem::file_size(path_, ec) == 0;
    if (!file_.open(path_))
      throw std::runtime_error("history: cannot open " + path_);
    if (fresh && !file_.write(kHeader))
      throw std::runtime_error("history: cannot write header to " + path_);
  }

  if (!file_.write(csvLine(rec)) || !file_.flush())
    throw std::runtime_error("history: write failed for " + path_);
}

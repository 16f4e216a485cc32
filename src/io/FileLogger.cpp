/* @file FileLogger.cpp
 * @brief fopen/fwrite backed line buffer
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "io/FileLogger.hpp"

#include <utility>

using namespace cloneflow::io;

FileLogger::~FileLogger() { static_cast<void>(close()); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), buffer_(std::move(other.buffer_)) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    static_cast<void>(close());
    fp_ = std::exchange(other.fp_, nullptr);
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool FileLogger::open(const std::string& path) {
  if (fp_ && !close())
    return false;
  fp_ = std::fopen(path.c_str(), "a");
  if (!fp_)
    return false;
  buffer_.reserve(kSpillBytes);
  return true;
}

bool FileLogger::write(const std::string& line) {
  if (!fp_)
    return false;
  buffer_.insert(buffer_.end(), line.begin(), line.end());
  if (buffer_.size() >= kSpillBytes)
    return flush();
  return true;
}

bool FileLogger::flush() {
  if (!fp_)
    return false;
  if (!buffer_.empty()) {
    const std::size_t written = std::fwrite(buffer_.data(), 1, buffer_.size(), fp_);
    const bool complete = written == buffer_.size();
    buffer_.clear();
    if (!complete)
      return false;
  }
  return std::fflush(fp_) == 0;
}

bool FileLogger::close() {
  if (!fp_)
    return true;
  const bool flushed = flush();
  const bool closed = std::fclose(fp_) == 0;
  fp_ = nullptr;
  return flushed && closed;
}

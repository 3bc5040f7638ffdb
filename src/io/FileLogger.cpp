/* @file FileLogger.cpp
 * @brief buffered fwrite-based file sink
 *
 * © 2025 ferry contributors — MIT-licensed.
 */

// STL headers
#include <utility>

// ferry headers
#include "io/FileLogger.hpp"

using namespace ferry::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), buffer_(std::move(other.buffer_)) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "a");
  if (!fp_)
    return false;
  buffer_.reserve(kChunk);
  return true;
}

void FileLogger::write(const std::string& line) {
  if (!fp_)
    return;
  buffer_.insert(buffer_.end(), line.begin(), line.end());
  if (buffer_.size() >= kChunk)
    flush();
}

bool FileLogger::flush() {
  if (!fp_)
    return false;
  bool ok = true;
  if (!buffer_.empty()) {
    ok = std::fwrite(buffer_.data(), 1, buffer_.size(), fp_) == buffer_.size();
    buffer_.clear();
  }
  return std::fflush(fp_) == 0 && ok;
}

void FileLogger::close() {
  if (!fp_)
    return;
  flush();
  std::fclose(fp_);
  fp_ = nullptr;
}

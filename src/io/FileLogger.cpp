/* @file FileLogger.cpp
 * @brief buffered stdio writer
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

// labcell headers
#include "io/FileLogger.hpp"

using namespace labcell::io;

FileLogger::~FileLogger() { (void)close(); }

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
  fp_ = std::fopen(path.c_str(), "w");
  if (!fp_) {
    std::cerr << "Error " << errno << " from fopen(" << path << "): " << strerror(errno) << "\n";
    return false;
  }
  buffer_.reserve(kChunkSize);
  return true;
}

bool FileLogger::write(const std::string& csv) {
  if (!fp_)
    return false;
  buffer_.insert(buffer_.end(), csv.begin(), csv.end());
  if (buffer_.size() >= kChunkSize)
    return flush();
  return true;
}

bool FileLogger::flush() {
  if (!fp_)
    return false;

  if (!buffer_.empty()) {
    const std::size_t written = std::fwrite(buffer_.data(), 1, buffer_.size(), fp_);
    if (written != buffer_.size()) {
      std::cerr << "Error " << errno << " from fwrite: " << strerror(errno) << "\n";
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(written));
      return false;
    }
    buffer_.clear();
  }
  return std::fflush(fp_) == 0;
}

bool FileLogger::close() {
  if (!fp_)
    return true;
  const bool flushed = flush();
  const bool closed = std::fclose(fp_) == 0;
  fp_ = nullptr;
  buffer_.clear();
  return flushed && closed;
}

/* @file FileLogger.cpp
 * @brief buffered fopen/fwrite log sink
 *
 * © 2026 hotspot-toggle contributors — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstring> // for strerror
#include <iostream>
#include <stdexcept>
#include <utility>

// Hotspot headers
#include "io/FileLogger.hpp"

using namespace hotspot::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_{ std::exchange(other.fp_, nullptr) }, buffer_{ std::move(other.buffer_) } {}

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
  if (!fp_) {
    std::cerr << "Error " << errno << " from fopen(" << path << "): " << strerror(errno) << "\n";
    return false;
  }
  buffer_.reserve(kFlushThreshold);
  return true;
}

void FileLogger::write(const std::string& line) {
  if (!fp_)
    throw std::runtime_error("[FileLogger] write on closed file");

  buffer_.insert(buffer_.end(), line.begin(), line.end());
  if (buffer_.size() >= kFlushThreshold && !flush())
    throw std::runtime_error("[FileLogger] flush failed");
}

bool FileLogger::flush() {
  if (!fp_)
    return false;

  if (!buffer_.empty()) {
    const std::size_t written = std::fwrite(buffer_.data(), 1, buffer_.size(), fp_);
    if (written != buffer_.size()) {
      std::cerr << "Error " << errno << " from fwrite: " << strerror(errno) << "\n";
      return false;
    }
    buffer_.clear();
  }
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (!fp_)
    return;
  flush();
  std::fclose(fp_);
  fp_ = nullptr;
}

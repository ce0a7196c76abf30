/* @file FileLogger.cpp
 * @brief chunked fwrite behind an in-memory buffer
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

// PetCtl headers
#include "io/FileLogger.hpp"

using namespace petctl::io;

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
  fp_ = std::fopen(path.c_str(), "w");
  if (!fp_) {
    std::cerr << "Error " << errno << " from fopen: " << strerror(errno) << "\n";
    return false;
  }
  buffer_.reserve(kChunkSize);
  return true;
}

void FileLogger::write(const std::string& csv) {
  if (!fp_)
    return;
  buffer_.insert(buffer_.end(), csv.begin(), csv.end());
  if (buffer_.size() >= kChunkSize && !flush())
    std::cerr << "[FileLogger] chunk write failed\n";
}

bool FileLogger::flush() {
  if (!fp_)
    return false;

  std::size_t total = 0;
  while (total < buffer_.size()) {
    const std::size_t n = std::min(kChunkSize, buffer_.size() - total);
    const std::size_t written = std::fwrite(buffer_.data() + total, 1, n, fp_);
    if (written != n) {
      std::cerr << "Error " << errno << " from fwrite: " << strerror(errno) << "\n";
      buffer_.erase(buffer_.begin(), buffer_.begin() + total + written);
      return false;
    }
    total += written;
  }
  buffer_.clear();
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (!fp_)
    return;
  if (!flush())
    std::cerr << "[FileLogger] data lost on close\n";
  std::fclose(fp_);
  fp_ = nullptr;
}

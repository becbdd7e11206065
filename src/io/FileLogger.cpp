/* @file FileLogger.cpp
 * @brief buffered fwrite sink
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstring> // for strerror
#include <iostream>

#include "io/FileLogger.hpp"

using namespace retro::io;

FileLogger::~FileLogger() { close(); }

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "a");
  if (!fp_) {
    std::cerr << "[FileLogger] open " << path << ": " << strerror(errno) << "\n";
    return false;
  }
  buffer_.reserve(kChunkSize);
  return true;
}

void FileLogger::write(const std::string& line) {
  if (!fp_)
    return;
  buffer_.insert(buffer_.end(), line.begin(), line.end());
  if (buffer_.size() >= kChunkSize)
    flush();
}

bool FileLogger::flush() {
  if (!fp_)
    return false;
  if (!buffer_.empty()) {
    std::size_t n = std::fwrite(buffer_.data(), 1, buffer_.size(), fp_);
    if (n != buffer_.size()) {
      std::cerr << "[FileLogger] short write: " << strerror(errno) << "\n";
      buffer_.clear();
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

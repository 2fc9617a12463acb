/* @file Logger.cpp
 * @brief line formatting + fan-out to stderr and the optional log file
 *
 * © 2026 hotspot-toggle contributors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <ctime>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

// Hotspot headers
#include "core/Logger.hpp"
#include "io/FileLogger.hpp"

using namespace hotspot::core;

Logger::Logger() = default;
Logger::~Logger() = default;

void Logger::setMinSeverity(Severity s) {
  std::lock_guard<std::mutex> lock(mtx_);
  minSeverity_ = s;
}

void Logger::setConsoleEnabled(bool enabled) {
  std::lock_guard<std::mutex> lock(mtx_);
  console_ = enabled;
}

void Logger::attachFile(std::shared_ptr<io::FileLogger> file) {
  std::lock_guard<std::mutex> lock(mtx_);
  file_ = std::move(file);
}

std::string Logger::formatLine(Severity severity, const std::string& message) {
  const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&now, &tm);

  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);
  return std::string(stamp) + " [" + toString(severity) + "] " + message;
}

void Logger::log(Severity severity, const std::string& message) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (severity < minSeverity_)
    return;

  const std::string line = formatLine(severity, message);
  if (console_)
    std::cerr << line << '\n';

  if (!file_)
    return;

  try {
    file_->write(line + "\n");
    if (severity == Severity::Error && !file_->flush())
      throw std::runtime_error("flush failed");
  } catch (const std::exception& e) {
    // a broken sink must not take the toggle down with it
    std::cerr << "[Logger] log file disabled: " << e.what() << '\n';
    file_.reset();
  }
}

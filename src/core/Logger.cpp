/* @file Logger.cpp
 * @brief CSV run log + stderr echo
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

// Keel headers
#include "core/Logger.hpp"
#include "io/FileLogger.hpp"

using namespace keel::core;

namespace {

  std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm{};
    ::localtime_r(&t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
       << ms.count();
    return ss.str();
  }

  // RFC 4180 quoting, only when needed
  std::string csvField(const std::string& s) {
    if (s.find_first_of(",\"\n\r") == std::string::npos)
      return s;
    std::string out = "\"";
    for (char c : s) {
      if (c == '"')
        out += '"';
      out += c;
    }
    out += '"';
    return out;
  }

} // namespace

const char* keel::core::toString(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  default:
    return "UNKNOWN";
  }
}

Logger::Logger() : Logger(std::cerr) {}

Logger::Logger(std::ostream& echo) : file_(std::make_unique<io::FileLogger>()), echo_(&echo) {}

Logger::~Logger() { finishRun(); }

bool Logger::startNewRun(const std::string& path) {
  std::lock_guard<std::mutex> lock(mtx_);
  std::error_code ec;
  const bool fresh = !std::filesystem::exists(path, ec) || std::filesystem::file_size(path, ec) == 0;
  if (!file_->open(path))
    return false;
  if (fresh)
    file_->write("time,level,component,message\n");
  return true;
}

void Logger::log(const LogEvent& event) {
  std::lock_guard<std::mutex> lock(mtx_);
  const std::string ts = timestamp();

  if (file_->isOpen())
    file_->write(ts + ',' + toString(event.level) + ',' + csvField(event.component) + ',' +
                 csvField(event.message) + '\n');

  if (echo_ && event.level >= consoleLevel_)
    *echo_ << '[' << ts << "] [" << toString(event.level) << "] [" << event.component << "] "
           << event.message << std::endl;
}

void Logger::finishRun() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (file_)
    file_->close();
}

void Logger::setConsoleLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mtx_);
  consoleLevel_ = level;
}

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only; debug builds log to stdout from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <string_view>
#include <vector>

#ifndef VANTAGE_APP_NAME
#define VANTAGE_APP_NAME "Vantage"
#endif

namespace Vantage {
namespace {

constexpr size_t MAX_LOG_FILES = 5;
constexpr size_t LINES_PER_FLUSH = 50;
constexpr std::string_view LOG_PREFIX = "vantage_";

std::tm toLocalTime(std::chrono::system_clock::time_point point) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(point);
  std::tm local{};
#ifdef _WIN32
  localtime_s(&local, &seconds);
#else
  localtime_r(&seconds, &local);
#endif
  return local;
}

std::string formatTime(const std::tm &local, const char *pattern) {
  char buffer[32];
  const size_t written = std::strftime(buffer, sizeof(buffer), pattern, &local);
  return std::string(buffer, written);
}

// Log file names embed their start time, so name order is age order
void rotateLogs(const std::filesystem::path &dir) {
  std::vector<std::filesystem::path> existing;
  std::error_code ec;
  for (const auto &entry : std::filesystem::directory_iterator(dir, ec)) {
    const std::string name = entry.path().filename().string();
    if (entry.is_regular_file(ec) && name.starts_with(LOG_PREFIX) &&
        entry.path().extension() == ".log") {
      existing.push_back(entry.path());
    }
  }
  if (existing.size() < MAX_LOG_FILES) {
    return;
  }
  std::sort(existing.begin(), existing.end());
  const size_t excess = existing.size() - (MAX_LOG_FILES - 1);
  for (size_t i = 0; i < excess; ++i) {
    std::filesystem::remove(existing[i], ec);
  }
}

// Appends to <pref path>/logs/vantage_<start time>.log, opened on first use
class LogFileSink {
public:
  static LogFileSink &Instance() {
    static LogFileSink sink;
    return sink;
  }

  void append(const char *level, const char *system, const char *message) {
    std::lock_guard<std::mutex> lock(Logger::s_logMutex);
    if (!m_opened) {
      open();
    }
    if (!m_out.is_open()) {
      return;
    }

    const auto now = std::chrono::system_clock::now();
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch())
                            .count() %
                        1000;
    m_out << std::format("{}.{:03} [{}] [{}] {}\n",
                         formatTime(toLocalTime(now), "%Y-%m-%d %H:%M:%S"),
                         millis, level, system, message);

    const bool critical = std::string_view(level) == "CRITICAL";
    if (critical || ++m_unflushed >= LINES_PER_FLUSH) {
      m_out.flush();
      m_unflushed = 0;
    }
  }

  LogFileSink(const LogFileSink &) = delete;
  LogFileSink &operator=(const LogFileSink &) = delete;

private:
  LogFileSink() = default;
  ~LogFileSink() {
    if (m_out.is_open()) {
      m_out.flush();
    }
  }

  void open() {
    m_opened = true;

    char *prefPath = SDL_GetPrefPath("Vantage", VANTAGE_APP_NAME);
    if (prefPath == nullptr) {
      return;
    }
    const std::filesystem::path dir = std::filesystem::path(prefPath) / "logs";
    SDL_free(prefPath);

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
      return;
    }
    rotateLogs(dir);

    const std::tm started = toLocalTime(std::chrono::system_clock::now());
    const std::string fileName = std::string(LOG_PREFIX) +
                                 formatTime(started, "%Y%m%d_%H%M%S") + ".log";
    m_out.open(dir / fileName, std::ios::out | std::ios::app);
    if (m_out.is_open()) {
      m_out << std::format("=== {} log, started {} ===\n\n", VANTAGE_APP_NAME,
                           formatTime(started, "%Y-%m-%d %H:%M:%S"));
      m_out.flush();
    }
  }

  std::ofstream m_out;
  size_t m_unflushed{0};
  bool m_opened{false};
};

} // namespace

void Logger::Log(const char *level, const char *system, const std::string &message) {
  Log(level, system, message.c_str());
}

void Logger::Log(const char *level, const char *system, const char *message) {
  if (IsBenchmarkMode()) {
    return;
  }
  LogFileSink::Instance().append(level, system, message);
}

} // namespace Vantage

#endif // DEBUG

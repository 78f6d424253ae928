/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VANTAGE_LOGGER_HPP
#define VANTAGE_LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - mutex: Required for thread-safe logging
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep
#include <cstdint> // IWYU pragma: keep
#include <cstdio> // IWYU pragma: keep
#include <mutex> // IWYU pragma: keep
#include <string> // IWYU pragma: keep

namespace Vantage {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release)
  ERROR_LEVEL = 1,  // Renamed to avoid macro conflicts
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only
};

#ifdef DEBUG
// Full console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Vantage - [%s] %s: %s\n", system, getLevelString(level), message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define VANTAGE_CRITICAL(system, msg)                                          \
  Vantage::Logger::Log(Vantage::LogLevel::CRITICAL, system, msg)
#define VANTAGE_ERROR(system, msg)                                             \
  Vantage::Logger::Log(Vantage::LogLevel::ERROR_LEVEL, system, msg)
#define VANTAGE_WARN(system, msg)                                              \
  Vantage::Logger::Log(Vantage::LogLevel::WARNING, system, msg)
#define VANTAGE_INFO(system, msg)                                              \
  Vantage::Logger::Log(Vantage::LogLevel::INFO, system, msg)
#define VANTAGE_DEBUG(system, msg)                                             \
  Vantage::Logger::Log(Vantage::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - errors go to a log file, everything else compiles out
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex;

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  // Defined in Logger.cpp
  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define VANTAGE_CRITICAL(system, msg)                                          \
  Vantage::Logger::Log("CRITICAL", system, msg)

#define VANTAGE_ERROR(system, msg) Vantage::Logger::Log("ERROR", system, msg)

#define VANTAGE_WARN(system, msg) ((void)0)  // Zero overhead
#define VANTAGE_INFO(system, msg) ((void)0)  // Zero overhead
#define VANTAGE_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each system

// Core Systems
#define THREADSYSTEM_CRITICAL(msg) VANTAGE_CRITICAL("ThreadSystem", msg)
#define THREADSYSTEM_ERROR(msg) VANTAGE_ERROR("ThreadSystem", msg)
#define THREADSYSTEM_WARN(msg) VANTAGE_WARN("ThreadSystem", msg)
#define THREADSYSTEM_INFO(msg) VANTAGE_INFO("ThreadSystem", msg)
#define THREADSYSTEM_DEBUG(msg) VANTAGE_DEBUG("ThreadSystem", msg)

#define SCHEDULER_CRITICAL(msg) VANTAGE_CRITICAL("FrameScheduler", msg)
#define SCHEDULER_ERROR(msg) VANTAGE_ERROR("FrameScheduler", msg)
#define SCHEDULER_WARN(msg) VANTAGE_WARN("FrameScheduler", msg)
#define SCHEDULER_INFO(msg) VANTAGE_INFO("FrameScheduler", msg)
#define SCHEDULER_DEBUG(msg) VANTAGE_DEBUG("FrameScheduler", msg)

// Manager Systems
#define POSTQUERY_CRITICAL(msg) VANTAGE_CRITICAL("PostQueryManager", msg)
#define POSTQUERY_ERROR(msg) VANTAGE_ERROR("PostQueryManager", msg)
#define POSTQUERY_WARN(msg) VANTAGE_WARN("PostQueryManager", msg)
#define POSTQUERY_INFO(msg) VANTAGE_INFO("PostQueryManager", msg)
#define POSTQUERY_DEBUG(msg) VANTAGE_DEBUG("PostQueryManager", msg)

#define COLLISION_CRITICAL(msg) VANTAGE_CRITICAL("CollisionManager", msg)
#define COLLISION_ERROR(msg) VANTAGE_ERROR("CollisionManager", msg)
#define COLLISION_WARN(msg) VANTAGE_WARN("CollisionManager", msg)
#define COLLISION_INFO(msg) VANTAGE_INFO("CollisionManager", msg)
#define COLLISION_DEBUG(msg) VANTAGE_DEBUG("CollisionManager", msg)

#define ACTOR_CRITICAL(msg) VANTAGE_CRITICAL("ActorDataManager", msg)
#define ACTOR_ERROR(msg) VANTAGE_ERROR("ActorDataManager", msg)
#define ACTOR_WARN(msg) VANTAGE_WARN("ActorDataManager", msg)
#define ACTOR_INFO(msg) VANTAGE_INFO("ActorDataManager", msg)
#define ACTOR_DEBUG(msg) VANTAGE_DEBUG("ActorDataManager", msg)

#define SETTINGS_CRITICAL(msg) VANTAGE_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) VANTAGE_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) VANTAGE_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) VANTAGE_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) VANTAGE_DEBUG("SettingsManager", msg)

#define SCENARIO_CRITICAL(msg) VANTAGE_CRITICAL("ScenarioLoader", msg)
#define SCENARIO_ERROR(msg) VANTAGE_ERROR("ScenarioLoader", msg)
#define SCENARIO_WARN(msg) VANTAGE_WARN("ScenarioLoader", msg)
#define SCENARIO_INFO(msg) VANTAGE_INFO("ScenarioLoader", msg)
#define SCENARIO_DEBUG(msg) VANTAGE_DEBUG("ScenarioLoader", msg)

} // namespace Vantage

#endif // VANTAGE_LOGGER_HPP

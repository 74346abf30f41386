/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace Lattice {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Debug builds print every level to stdout
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
    printf("Lattice - [%s] %s: %s\n", system, getLevelString(level), message);
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

#define LATTICE_CRITICAL(system, msg)                                          \
  Lattice::Logger::Log(Lattice::LogLevel::CRITICAL, system, msg)
#define LATTICE_ERROR(system, msg)                                             \
  Lattice::Logger::Log(Lattice::LogLevel::ERROR_LEVEL, system, msg)
#define LATTICE_WARN(system, msg)                                              \
  Lattice::Logger::Log(Lattice::LogLevel::WARNING, system, msg)
#define LATTICE_INFO(system, msg)                                              \
  Lattice::Logger::Log(Lattice::LogLevel::INFO, system, msg)
#define LATTICE_DEBUG(system, msg)                                             \
  Lattice::Logger::Log(Lattice::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds write CRITICAL/ERROR to a log file, everything else compiles away
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex; // Public for macro access

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

#define LATTICE_CRITICAL(system, msg)                                          \
  Lattice::Logger::Log("CRITICAL", system, msg)

#define LATTICE_ERROR(system, msg) Lattice::Logger::Log("ERROR", system, msg)

#define LATTICE_WARN(system, msg) ((void)0)  // Zero overhead
#define LATTICE_INFO(system, msg) ((void)0)  // Zero overhead
#define LATTICE_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each subsystem

#define CACHE_CRITICAL(msg) LATTICE_CRITICAL("SpatialCache", msg)
#define CACHE_ERROR(msg) LATTICE_ERROR("SpatialCache", msg)
#define CACHE_WARN(msg) LATTICE_WARN("SpatialCache", msg)
#define CACHE_INFO(msg) LATTICE_INFO("SpatialCache", msg)
#define CACHE_DEBUG(msg) LATTICE_DEBUG("SpatialCache", msg)

#define SPATIAL_INDEX_CRITICAL(msg) LATTICE_CRITICAL("SpatialIndex", msg)
#define SPATIAL_INDEX_ERROR(msg) LATTICE_ERROR("SpatialIndex", msg)
#define SPATIAL_INDEX_WARN(msg) LATTICE_WARN("SpatialIndex", msg)
#define SPATIAL_INDEX_INFO(msg) LATTICE_INFO("SpatialIndex", msg)
#define SPATIAL_INDEX_DEBUG(msg) LATTICE_DEBUG("SpatialIndex", msg)

#define INVALIDATION_CRITICAL(msg) LATTICE_CRITICAL("InvalidationBus", msg)
#define INVALIDATION_ERROR(msg) LATTICE_ERROR("InvalidationBus", msg)
#define INVALIDATION_WARN(msg) LATTICE_WARN("InvalidationBus", msg)
#define INVALIDATION_INFO(msg) LATTICE_INFO("InvalidationBus", msg)
#define INVALIDATION_DEBUG(msg) LATTICE_DEBUG("InvalidationBus", msg)

#define REGISTRY_CRITICAL(msg) LATTICE_CRITICAL("CacheRegistry", msg)
#define REGISTRY_ERROR(msg) LATTICE_ERROR("CacheRegistry", msg)
#define REGISTRY_WARN(msg) LATTICE_WARN("CacheRegistry", msg)
#define REGISTRY_INFO(msg) LATTICE_INFO("CacheRegistry", msg)
#define REGISTRY_DEBUG(msg) LATTICE_DEBUG("CacheRegistry", msg)

#define SETTINGS_CRITICAL(msg) LATTICE_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) LATTICE_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) LATTICE_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) LATTICE_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) LATTICE_DEBUG("SettingsManager", msg)

// Benchmark mode convenience macros
#define LATTICE_ENABLE_BENCHMARK_MODE() Lattice::Logger::SetBenchmarkMode(true)
#define LATTICE_DISABLE_BENCHMARK_MODE()                                       \
  Lattice::Logger::SetBenchmarkMode(false)

} // namespace Lattice

#endif // LOGGER_HPP

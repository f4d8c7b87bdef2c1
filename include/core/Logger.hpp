/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - cstdint: Required for uint8_t type
// - mutex: Required for serialized console output
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic>  // IWYU pragma: keep
#include <cstdint> // IWYU pragma: keep
#include <cstdio>  // IWYU pragma: keep
#include <mutex>   // IWYU pragma: keep
#include <string>  // IWYU pragma: keep

namespace HexCrawl {
enum class LogLevel : uint8_t {
  CRITICAL = 0,    // Always logs (even in release)
  ERROR_LEVEL = 1, // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,     // Debug only
  INFO = 3,        // Debug only
  DEBUG_LEVEL = 4  // Debug only (renamed to avoid macro conflicts)
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
    printf("HexCrawl Engine - [%s] %s: %s\n", system, getLevelString(level),
           message);
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

inline std::mutex Logger::s_logMutex{};

#define HEXCRAWL_CRITICAL(system, msg)                                         \
  HexCrawl::Logger::Log(HexCrawl::LogLevel::CRITICAL, system, msg)
#define HEXCRAWL_ERROR(system, msg)                                            \
  HexCrawl::Logger::Log(HexCrawl::LogLevel::ERROR_LEVEL, system, msg)
#define HEXCRAWL_WARN(system, msg)                                             \
  HexCrawl::Logger::Log(HexCrawl::LogLevel::WARNING, system, msg)
#define HEXCRAWL_INFO(system, msg)                                             \
  HexCrawl::Logger::Log(HexCrawl::LogLevel::INFO, system, msg)
#define HEXCRAWL_DEBUG(system, msg)                                            \
  HexCrawl::Logger::Log(HexCrawl::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds write CRITICAL and ERROR to a rotating log file (Logger.cpp)
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define HEXCRAWL_CRITICAL(system, msg)                                         \
  HexCrawl::Logger::Log("CRITICAL", system, msg)
#define HEXCRAWL_ERROR(system, msg) HexCrawl::Logger::Log("ERROR", system, msg)

#define HEXCRAWL_WARN(system, msg) ((void)0)  // Zero overhead
#define HEXCRAWL_INFO(system, msg) ((void)0)  // Zero overhead
#define HEXCRAWL_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};

// Convenience macros for each engine system

#define HEX_ERROR(msg) HEXCRAWL_ERROR("HexAlgebra", msg)
#define HEX_WARN(msg) HEXCRAWL_WARN("HexAlgebra", msg)
#define HEX_DEBUG(msg) HEXCRAWL_DEBUG("HexAlgebra", msg)

#define PATHFIND_CRITICAL(msg) HEXCRAWL_CRITICAL("Pathfinding", msg)
#define PATHFIND_ERROR(msg) HEXCRAWL_ERROR("Pathfinding", msg)
#define PATHFIND_WARN(msg) HEXCRAWL_WARN("Pathfinding", msg)
#define PATHFIND_INFO(msg) HEXCRAWL_INFO("Pathfinding", msg)
#define PATHFIND_DEBUG(msg) HEXCRAWL_DEBUG("Pathfinding", msg)

#define THREAT_ERROR(msg) HEXCRAWL_ERROR("ThreatManager", msg)
#define THREAT_WARN(msg) HEXCRAWL_WARN("ThreatManager", msg)
#define THREAT_INFO(msg) HEXCRAWL_INFO("ThreatManager", msg)
#define THREAT_DEBUG(msg) HEXCRAWL_DEBUG("ThreatManager", msg)

#define AI_CRITICAL(msg) HEXCRAWL_CRITICAL("MonsterAI", msg)
#define AI_ERROR(msg) HEXCRAWL_ERROR("MonsterAI", msg)
#define AI_WARN(msg) HEXCRAWL_WARN("MonsterAI", msg)
#define AI_INFO(msg) HEXCRAWL_INFO("MonsterAI", msg)
#define AI_DEBUG(msg) HEXCRAWL_DEBUG("MonsterAI", msg)

#define COMBAT_CRITICAL(msg) HEXCRAWL_CRITICAL("CombatController", msg)
#define COMBAT_ERROR(msg) HEXCRAWL_ERROR("CombatController", msg)
#define COMBAT_WARN(msg) HEXCRAWL_WARN("CombatController", msg)
#define COMBAT_INFO(msg) HEXCRAWL_INFO("CombatController", msg)
#define COMBAT_DEBUG(msg) HEXCRAWL_DEBUG("CombatController", msg)

#define ENTITY_ERROR(msg) HEXCRAWL_ERROR("Entity", msg)
#define ENTITY_WARN(msg) HEXCRAWL_WARN("Entity", msg)
#define ENTITY_INFO(msg) HEXCRAWL_INFO("Entity", msg)
#define ENTITY_DEBUG(msg) HEXCRAWL_DEBUG("Entity", msg)

#define GAMESTATE_CRITICAL(msg) HEXCRAWL_CRITICAL("GameStateManager", msg)
#define GAMESTATE_ERROR(msg) HEXCRAWL_ERROR("GameStateManager", msg)
#define GAMESTATE_WARN(msg) HEXCRAWL_WARN("GameStateManager", msg)
#define GAMESTATE_INFO(msg) HEXCRAWL_INFO("GameStateManager", msg)
#define GAMESTATE_DEBUG(msg) HEXCRAWL_DEBUG("GameStateManager", msg)

#define GAMELOOP_CRITICAL(msg) HEXCRAWL_CRITICAL("GameLoop", msg)
#define GAMELOOP_ERROR(msg) HEXCRAWL_ERROR("GameLoop", msg)
#define GAMELOOP_WARN(msg) HEXCRAWL_WARN("GameLoop", msg)
#define GAMELOOP_INFO(msg) HEXCRAWL_INFO("GameLoop", msg)
#define GAMELOOP_DEBUG(msg) HEXCRAWL_DEBUG("GameLoop", msg)

#define SETTINGS_ERROR(msg) HEXCRAWL_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) HEXCRAWL_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) HEXCRAWL_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) HEXCRAWL_DEBUG("SettingsManager", msg)

#define TEMPLATE_ERROR(msg) HEXCRAWL_ERROR("MonsterTemplateManager", msg)
#define TEMPLATE_WARN(msg) HEXCRAWL_WARN("MonsterTemplateManager", msg)
#define TEMPLATE_INFO(msg) HEXCRAWL_INFO("MonsterTemplateManager", msg)
#define TEMPLATE_DEBUG(msg) HEXCRAWL_DEBUG("MonsterTemplateManager", msg)

// Benchmark mode convenience macros
#define HEXCRAWL_ENABLE_BENCHMARK_MODE()                                       \
  HexCrawl::Logger::SetBenchmarkMode(true)
#define HEXCRAWL_DISABLE_BENCHMARK_MODE()                                      \
  HexCrawl::Logger::SetBenchmarkMode(false)

} // namespace HexCrawl

#endif // LOGGER_HPP

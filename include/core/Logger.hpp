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

namespace SwarmForge {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release for crashes)
  ERROR_LEVEL = 1,  // Release builds write these to the log file
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

class Logger {
private:
  static inline std::atomic<bool> s_benchmarkMode{false};
  static inline std::mutex s_logMutex{};

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

#ifdef DEBUG
  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("SwarmForge - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }
#else
  // Release builds route CRITICAL/ERROR to a rotating file (see Logger.cpp)
  static void Log(LogLevel level, const char *system,
                  const std::string &message);
  static void Log(LogLevel level, const char *system, const char *message);
#endif

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

#define SWARM_CRITICAL(system, msg)                                            \
  SwarmForge::Logger::Log(SwarmForge::LogLevel::CRITICAL, system, msg)
#define SWARM_ERROR(system, msg)                                               \
  SwarmForge::Logger::Log(SwarmForge::LogLevel::ERROR_LEVEL, system, msg)

#ifdef DEBUG
#define SWARM_WARN(system, msg)                                                \
  SwarmForge::Logger::Log(SwarmForge::LogLevel::WARNING, system, msg)
#define SWARM_INFO(system, msg)                                                \
  SwarmForge::Logger::Log(SwarmForge::LogLevel::INFO, system, msg)
#define SWARM_DEBUG(system, msg)                                               \
  SwarmForge::Logger::Log(SwarmForge::LogLevel::DEBUG_LEVEL, system, msg)
#else
#define SWARM_WARN(system, msg) ((void)0)  // Zero overhead
#define SWARM_INFO(system, msg) ((void)0)  // Zero overhead
#define SWARM_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Convenience macros for each manager and core system

// Core Systems
#define NODE_CRITICAL(msg) SWARM_CRITICAL("SimulationNode", msg)
#define NODE_ERROR(msg) SWARM_ERROR("SimulationNode", msg)
#define NODE_WARN(msg) SWARM_WARN("SimulationNode", msg)
#define NODE_INFO(msg) SWARM_INFO("SimulationNode", msg)
#define NODE_DEBUG(msg) SWARM_DEBUG("SimulationNode", msg)

#define AUTHORITY_CRITICAL(msg) SWARM_CRITICAL("AuthorityService", msg)
#define AUTHORITY_ERROR(msg) SWARM_ERROR("AuthorityService", msg)
#define AUTHORITY_WARN(msg) SWARM_WARN("AuthorityService", msg)
#define AUTHORITY_INFO(msg) SWARM_INFO("AuthorityService", msg)
#define AUTHORITY_DEBUG(msg) SWARM_DEBUG("AuthorityService", msg)

#define DEMO_CRITICAL(msg) SWARM_CRITICAL("Demo", msg)
#define DEMO_ERROR(msg) SWARM_ERROR("Demo", msg)
#define DEMO_WARN(msg) SWARM_WARN("Demo", msg)
#define DEMO_INFO(msg) SWARM_INFO("Demo", msg)
#define DEMO_DEBUG(msg) SWARM_DEBUG("Demo", msg)

// Manager Systems
#define OWNERSHIP_CRITICAL(msg) SWARM_CRITICAL("OwnershipManager", msg)
#define OWNERSHIP_ERROR(msg) SWARM_ERROR("OwnershipManager", msg)
#define OWNERSHIP_WARN(msg) SWARM_WARN("OwnershipManager", msg)
#define OWNERSHIP_INFO(msg) SWARM_INFO("OwnershipManager", msg)
#define OWNERSHIP_DEBUG(msg) SWARM_DEBUG("OwnershipManager", msg)

#define FALLBACK_CRITICAL(msg) SWARM_CRITICAL("FallbackSimulator", msg)
#define FALLBACK_ERROR(msg) SWARM_ERROR("FallbackSimulator", msg)
#define FALLBACK_WARN(msg) SWARM_WARN("FallbackSimulator", msg)
#define FALLBACK_INFO(msg) SWARM_INFO("FallbackSimulator", msg)
#define FALLBACK_DEBUG(msg) SWARM_DEBUG("FallbackSimulator", msg)

#define STORE_CRITICAL(msg) SWARM_CRITICAL("AgentStateStore", msg)
#define STORE_ERROR(msg) SWARM_ERROR("AgentStateStore", msg)
#define STORE_WARN(msg) SWARM_WARN("AgentStateStore", msg)
#define STORE_INFO(msg) SWARM_INFO("AgentStateStore", msg)
#define STORE_DEBUG(msg) SWARM_DEBUG("AgentStateStore", msg)

#define SIGHT_CRITICAL(msg) SWARM_CRITICAL("SightManager", msg)
#define SIGHT_ERROR(msg) SWARM_ERROR("SightManager", msg)
#define SIGHT_WARN(msg) SWARM_WARN("SightManager", msg)
#define SIGHT_INFO(msg) SWARM_INFO("SightManager", msg)
#define SIGHT_DEBUG(msg) SWARM_DEBUG("SightManager", msg)

#define SETTINGS_CRITICAL(msg) SWARM_CRITICAL("SimulationSettings", msg)
#define SETTINGS_ERROR(msg) SWARM_ERROR("SimulationSettings", msg)
#define SETTINGS_WARNING(msg) SWARM_WARN("SimulationSettings", msg)
#define SETTINGS_INFO(msg) SWARM_INFO("SimulationSettings", msg)
#define SETTINGS_DEBUG(msg) SWARM_DEBUG("SimulationSettings", msg)

// Movement, physics and pathfinding
#define MOVEMENT_CRITICAL(msg) SWARM_CRITICAL("MovementBehavior", msg)
#define MOVEMENT_ERROR(msg) SWARM_ERROR("MovementBehavior", msg)
#define MOVEMENT_WARN(msg) SWARM_WARN("MovementBehavior", msg)
#define MOVEMENT_INFO(msg) SWARM_INFO("MovementBehavior", msg)
#define MOVEMENT_DEBUG(msg) SWARM_DEBUG("MovementBehavior", msg)

#define JUMP_CRITICAL(msg) SWARM_CRITICAL("JumpSimulator", msg)
#define JUMP_ERROR(msg) SWARM_ERROR("JumpSimulator", msg)
#define JUMP_WARN(msg) SWARM_WARN("JumpSimulator", msg)
#define JUMP_INFO(msg) SWARM_INFO("JumpSimulator", msg)
#define JUMP_DEBUG(msg) SWARM_DEBUG("JumpSimulator", msg)

#define PATHFIND_CRITICAL(msg) SWARM_CRITICAL("Pathfinding", msg)
#define PATHFIND_ERROR(msg) SWARM_ERROR("Pathfinding", msg)
#define PATHFIND_WARN(msg) SWARM_WARN("Pathfinding", msg)
#define PATHFIND_INFO(msg) SWARM_INFO("Pathfinding", msg)
#define PATHFIND_DEBUG(msg) SWARM_DEBUG("Pathfinding", msg)

#define WORLD_CRITICAL(msg) SWARM_CRITICAL("SpatialQuery", msg)
#define WORLD_ERROR(msg) SWARM_ERROR("SpatialQuery", msg)
#define WORLD_WARN(msg) SWARM_WARN("SpatialQuery", msg)
#define WORLD_INFO(msg) SWARM_INFO("SpatialQuery", msg)
#define WORLD_DEBUG(msg) SWARM_DEBUG("SpatialQuery", msg)

// Networking
#define SYNC_CRITICAL(msg) SWARM_CRITICAL("PositionSync", msg)
#define SYNC_ERROR(msg) SWARM_ERROR("PositionSync", msg)
#define SYNC_WARN(msg) SWARM_WARN("PositionSync", msg)
#define SYNC_INFO(msg) SWARM_INFO("PositionSync", msg)
#define SYNC_DEBUG(msg) SWARM_DEBUG("PositionSync", msg)

#define BUS_CRITICAL(msg) SWARM_CRITICAL("MessageBus", msg)
#define BUS_ERROR(msg) SWARM_ERROR("MessageBus", msg)
#define BUS_WARN(msg) SWARM_WARN("MessageBus", msg)
#define BUS_INFO(msg) SWARM_INFO("MessageBus", msg)
#define BUS_DEBUG(msg) SWARM_DEBUG("MessageBus", msg)

#define SERIAL_CRITICAL(msg) SWARM_CRITICAL("BinarySerializer", msg)
#define SERIAL_ERROR(msg) SWARM_ERROR("BinarySerializer", msg)
#define SERIAL_WARN(msg) SWARM_WARN("BinarySerializer", msg)
#define SERIAL_INFO(msg) SWARM_INFO("BinarySerializer", msg)
#define SERIAL_DEBUG(msg) SWARM_DEBUG("BinarySerializer", msg)

// Benchmark mode convenience macros
#define SWARM_ENABLE_BENCHMARK_MODE()                                          \
  SwarmForge::Logger::SetBenchmarkMode(true)
#define SWARM_DISABLE_BENCHMARK_MODE()                                         \
  SwarmForge::Logger::SetBenchmarkMode(false)

} // namespace SwarmForge

#endif // LOGGER_HPP

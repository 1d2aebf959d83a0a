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
#include <cstdint> // IWYU pragma: keep
#include <cstdio>  // IWYU pragma: keep
#include <string>  // IWYU pragma: keep

namespace PhantomMaze {
enum class LogLevel : uint8_t {
  CRITICAL = 0,    // Always logs (even in release, for invariant violations)
  ERROR_LEVEL = 1, // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,     // Debug only
  INFO = 3,        // Debug only
  DEBUG_LEVEL = 4  // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full logging system in debug builds. The simulation is single threaded so
// there is no lock around the console.
class Logger {
public:
  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    printf("PhantomMaze - [%s] %s: %s\n", system, getLevelString(level),
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

#define PHANTOM_CRITICAL(system, msg)                                          \
  PhantomMaze::Logger::Log(PhantomMaze::LogLevel::CRITICAL, system, msg)
#define PHANTOM_ERROR(system, msg)                                             \
  PhantomMaze::Logger::Log(PhantomMaze::LogLevel::ERROR_LEVEL, system, msg)
#define PHANTOM_WARN(system, msg)                                              \
  PhantomMaze::Logger::Log(PhantomMaze::LogLevel::WARNING, system, msg)
#define PHANTOM_INFO(system, msg)                                              \
  PhantomMaze::Logger::Log(PhantomMaze::LogLevel::INFO, system, msg)
#define PHANTOM_DEBUG(system, msg)                                             \
  PhantomMaze::Logger::Log(PhantomMaze::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - only CRITICAL and ERROR survive, written to a log file
// (see Logger.cpp)
class Logger {
public:
  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define PHANTOM_CRITICAL(system, msg)                                          \
  PhantomMaze::Logger::Log("CRITICAL", system, msg)

#define PHANTOM_ERROR(system, msg) PhantomMaze::Logger::Log("ERROR", system, msg)

#define PHANTOM_WARN(system, msg) ((void)0)  // Zero overhead
#define PHANTOM_INFO(system, msg) ((void)0)  // Zero overhead
#define PHANTOM_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Convenience macros for each subsystem

// Ghost controller and movers
#define GHOST_CRITICAL(msg) PHANTOM_CRITICAL("Ghost", msg)
#define GHOST_ERROR(msg) PHANTOM_ERROR("Ghost", msg)
#define GHOST_WARN(msg) PHANTOM_WARN("Ghost", msg)
#define GHOST_INFO(msg) PHANTOM_INFO("Ghost", msg)
#define GHOST_DEBUG(msg) PHANTOM_DEBUG("Ghost", msg)

#define MOVER_CRITICAL(msg) PHANTOM_CRITICAL("GhostMover", msg)
#define MOVER_ERROR(msg) PHANTOM_ERROR("GhostMover", msg)
#define MOVER_WARN(msg) PHANTOM_WARN("GhostMover", msg)
#define MOVER_INFO(msg) PHANTOM_INFO("GhostMover", msg)
#define MOVER_DEBUG(msg) PHANTOM_DEBUG("GhostMover", msg)

#define GHOSTMGR_CRITICAL(msg) PHANTOM_CRITICAL("GhostManager", msg)
#define GHOSTMGR_ERROR(msg) PHANTOM_ERROR("GhostManager", msg)
#define GHOSTMGR_WARN(msg) PHANTOM_WARN("GhostManager", msg)
#define GHOSTMGR_INFO(msg) PHANTOM_INFO("GhostManager", msg)
#define GHOSTMGR_DEBUG(msg) PHANTOM_DEBUG("GhostManager", msg)

// Manager Systems
#define EVENT_CRITICAL(msg) PHANTOM_CRITICAL("EventManager", msg)
#define EVENT_ERROR(msg) PHANTOM_ERROR("EventManager", msg)
#define EVENT_WARN(msg) PHANTOM_WARN("EventManager", msg)
#define EVENT_INFO(msg) PHANTOM_INFO("EventManager", msg)
#define EVENT_DEBUG(msg) PHANTOM_DEBUG("EventManager", msg)

#define SETTINGS_CRITICAL(msg) PHANTOM_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) PHANTOM_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) PHANTOM_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) PHANTOM_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) PHANTOM_DEBUG("SettingsManager", msg)

// Gameplay statistics
#define LEVEL_CRITICAL(msg) PHANTOM_CRITICAL("LevelStats", msg)
#define LEVEL_ERROR(msg) PHANTOM_ERROR("LevelStats", msg)
#define LEVEL_WARN(msg) PHANTOM_WARN("LevelStats", msg)
#define LEVEL_INFO(msg) PHANTOM_INFO("LevelStats", msg)
#define LEVEL_DEBUG(msg) PHANTOM_DEBUG("LevelStats", msg)

// World
#define MAZE_CRITICAL(msg) PHANTOM_CRITICAL("Maze", msg)
#define MAZE_ERROR(msg) PHANTOM_ERROR("Maze", msg)
#define MAZE_WARN(msg) PHANTOM_WARN("Maze", msg)
#define MAZE_INFO(msg) PHANTOM_INFO("Maze", msg)
#define MAZE_DEBUG(msg) PHANTOM_DEBUG("Maze", msg)

// Headless simulation driver
#define SIM_CRITICAL(msg) PHANTOM_CRITICAL("Simulation", msg)
#define SIM_ERROR(msg) PHANTOM_ERROR("Simulation", msg)
#define SIM_WARN(msg) PHANTOM_WARN("Simulation", msg)
#define SIM_INFO(msg) PHANTOM_INFO("Simulation", msg)
#define SIM_DEBUG(msg) PHANTOM_DEBUG("Simulation", msg)

} // namespace PhantomMaze

#endif // LOGGER_HPP

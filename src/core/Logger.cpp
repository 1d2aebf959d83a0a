/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Only compile this file for release builds - debug builds log inline
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace PhantomMaze {
namespace {

constexpr const char *kLogFilePrefix = "phantom_";

// File sink for release builds
class FileLogger {
public:
  static FileLogger &Instance() {
    static FileLogger instance;
    return instance;
  }

  void write(const char *level, const char *system, const char *message) {
    if (!m_initialized) {
      initialize();
    }

    if (!m_fileStream.is_open()) {
      return;
    }

    // Format: YYYY-MM-DD HH:MM:SS.mmm [LEVEL] [SYSTEM] message
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;

    std::tm timeinfo{};
#ifdef _WIN32
    localtime_s(&timeinfo, &time_t_now);
#else
    localtime_r(&time_t_now, &timeinfo);
#endif

    m_fileStream << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << '.'
                 << std::setfill('0') << std::setw(3) << ms.count() << " ["
                 << level << "] [" << system << "] " << message << '\n';

    // Invariant violations usually end the process, flush them right away
    if (std::strcmp(level, "CRITICAL") == 0 || ++m_messageCount >= 20) {
      m_fileStream.flush();
      m_messageCount = 0;
    }
  }

  FileLogger(const FileLogger &) = delete;
  FileLogger &operator=(const FileLogger &) = delete;

private:
  FileLogger() = default;

  ~FileLogger() {
    if (m_fileStream.is_open()) {
      m_fileStream.flush();
      m_fileStream.close();
    }
  }

  void initialize() {
    m_initialized = true;

    // PHANTOM_APP_NAME is defined via CMake from ${PROJECT_NAME}
    char *prefPath = SDL_GetPrefPath("PhantomMaze", PHANTOM_APP_NAME);
    if (prefPath == nullptr) {
      return;
    }

    namespace fs = std::filesystem;
    fs::path logDir = fs::path(prefPath) / "logs";
    SDL_free(prefPath);

    std::error_code ec;
    fs::create_directories(logDir, ec);
    if (ec) {
      return;
    }

    cleanOldLogs(logDir, 5);

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm timeinfo{};
#ifdef _WIN32
    localtime_s(&timeinfo, &time_t_now);
#else
    localtime_r(&time_t_now, &timeinfo);
#endif

    std::ostringstream filename;
    filename << kLogFilePrefix << std::put_time(&timeinfo, "%Y%m%d_%H%M%S")
             << ".log";

    m_fileStream.open(logDir / filename.str(), std::ios::out | std::ios::app);
    if (m_fileStream.is_open()) {
      m_fileStream << "=== " << PHANTOM_APP_NAME << " Log ===\n"
                   << "Started: "
                   << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << "\n\n";
      m_fileStream.flush();
    }
  }

  // Keeps the newest `keepCount` log files
  void cleanOldLogs(const std::filesystem::path &logDir, size_t keepCount) {
    namespace fs = std::filesystem;

    std::vector<fs::directory_entry> logFiles;
    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(logDir, ec)) {
      if (entry.path().extension() == ".log" &&
          entry.path().filename().string().starts_with(kLogFilePrefix)) {
        logFiles.push_back(entry);
      }
    }

    if (logFiles.size() <= keepCount) {
      return;
    }

    std::sort(logFiles.begin(), logFiles.end(),
              [](const fs::directory_entry &a, const fs::directory_entry &b) {
                return fs::last_write_time(a) < fs::last_write_time(b);
              });

    const size_t toRemove = logFiles.size() - keepCount;
    for (size_t i = 0; i < toRemove; ++i) {
      fs::remove(logFiles[i].path(), ec);
    }
  }

  std::ofstream m_fileStream;
  bool m_initialized{false};
  size_t m_messageCount{0};
};

} // anonymous namespace

void Logger::Log(const char *level, const char *system,
                 const std::string &message) {
  Log(level, system, message.c_str());
}

void Logger::Log(const char *level, const char *system, const char *message) {
  FileLogger::Instance().write(level, system, message);
}

} // namespace PhantomMaze

#endif // ifndef DEBUG

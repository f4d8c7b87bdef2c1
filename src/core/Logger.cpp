/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Debug builds log to the console from the header
#ifndef DEBUG

#include "core/Logger.hpp"
#include "core/LogFile.hpp"

#include <SDL3/SDL.h>

#include <filesystem>
#include <memory>
#include <mutex>

namespace HexCrawl {
namespace {

// Per-user writable location, e.g. ~/.local/share/HexCrawl/<app>/logs
std::filesystem::path releaseLogDirectory() {
  char *prefPath = SDL_GetPrefPath("HexCrawl", HEXCRAWL_APP_NAME);
  if (prefPath == nullptr) {
    return {};
  }
  std::filesystem::path directory = std::filesystem::path(prefPath) / "logs";
  SDL_free(prefPath);
  return directory;
}

struct ReleaseSink {
  std::mutex mutex;
  std::unique_ptr<LogFile> file;
  bool opened{false};

  // Opened on first use; a failed open disables file logging for the run
  LogFile *get() {
    if (!opened) {
      opened = true;
      const std::filesystem::path directory = releaseLogDirectory();
      if (!directory.empty()) {
        auto candidate = std::make_unique<LogFile>(directory);
        if (candidate->open()) {
          file = std::move(candidate);
        }
      }
    }
    return file.get();
  }
};

ReleaseSink &sink() {
  static ReleaseSink instance;
  return instance;
}

} // anonymous namespace

void Logger::Log(const char *level, const char *system,
                 const std::string &message) {
  Log(level, system, message.c_str());
}

void Logger::Log(const char *level, const char *system, const char *message) {
  if (s_benchmarkMode.load(std::memory_order_relaxed)) {
    return;
  }
  ReleaseSink &release = sink();
  std::lock_guard<std::mutex> lock(release.mutex);
  if (LogFile *file = release.get()) {
    file->write(level, system, message);
  }
}

} // namespace HexCrawl

#endif // ifndef DEBUG

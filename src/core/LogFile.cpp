/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/LogFile.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

#ifndef HEXCRAWL_APP_NAME
#define HEXCRAWL_APP_NAME "HexCrawlEngine"
#endif

namespace HexCrawl {

namespace fs = std::filesystem;

namespace {

constexpr const char *LOG_PREFIX = "hexcrawl_";
constexpr const char *LOG_EXTENSION = ".log";

std::tm toLocalTime(std::chrono::system_clock::time_point point) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(point);
  std::tm result{};
  localtime_r(&seconds, &result);
  return result;
}

fs::path uniqueSessionPath(const fs::path &directory, const std::tm &time) {
  std::ostringstream stem;
  stem << LOG_PREFIX << std::put_time(&time, "%Y%m%d_%H%M%S");

  std::error_code ec;
  fs::path candidate = directory / (stem.str() + LOG_EXTENSION);
  for (int suffix = 2; fs::exists(candidate, ec); ++suffix) {
    candidate = directory /
                (stem.str() + "_" + std::to_string(suffix) + LOG_EXTENSION);
  }
  return candidate;
}

} // anonymous namespace

LogFile::LogFile(fs::path directory, size_t keepCount)
    : m_directory(std::move(directory)), m_keepCount(keepCount) {}

LogFile::~LogFile() {
  if (m_stream.is_open()) {
    m_stream.flush();
  }
}

bool LogFile::open() {
  if (m_stream.is_open()) {
    return true;
  }

  std::error_code ec;
  fs::create_directories(m_directory, ec);
  if (ec) {
    return false;
  }

  pruneOldLogs(m_directory, m_keepCount);

  const std::tm started = toLocalTime(std::chrono::system_clock::now());
  m_path = uniqueSessionPath(m_directory, started);
  m_stream.open(m_path, std::ios::out | std::ios::trunc);
  if (!m_stream.is_open()) {
    return false;
  }

  m_stream << "=== " << HEXCRAWL_APP_NAME << " Log ===\n"
           << "Started: " << std::put_time(&started, "%Y-%m-%d %H:%M:%S")
           << "\n\n";
  m_stream.flush();
  m_pendingLines = 0;
  return true;
}

void LogFile::write(const char *level, const char *system,
                    const char *message) {
  if (!m_stream.is_open()) {
    return;
  }

  const auto now = std::chrono::system_clock::now();
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch())
                          .count() %
                      1000;
  m_stream << formatLine(toLocalTime(now), static_cast<int>(millis), level,
                         system, message)
           << '\n';

  ++m_pendingLines;
  if (std::strcmp(level, "CRITICAL") == 0 ||
      m_pendingLines >= FLUSH_INTERVAL) {
    flush();
  }
}

void LogFile::flush() {
  if (m_stream.is_open()) {
    m_stream.flush();
  }
  m_pendingLines = 0;
}

std::string LogFile::formatLine(const std::tm &time, int millis,
                                const char *level, const char *system,
                                const char *message) {
  std::ostringstream line;
  line << std::put_time(&time, "%Y-%m-%d %H:%M:%S") << '.'
       << std::setfill('0') << std::setw(3) << millis << " [" << level
       << "] [" << system << "] " << message;
  return line.str();
}

bool LogFile::isSessionLog(const fs::path &path) {
  return path.extension() == LOG_EXTENSION &&
         path.filename().string().starts_with(LOG_PREFIX);
}

size_t LogFile::pruneOldLogs(const fs::path &directory, size_t keepCount) {
  std::vector<std::pair<fs::file_time_type, fs::path>> sessions;
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(directory, ec)) {
    if (!entry.is_regular_file(ec) || !isSessionLog(entry.path())) {
      continue;
    }
    const fs::file_time_type written = entry.last_write_time(ec);
    if (!ec) {
      sessions.emplace_back(written, entry.path());
    }
  }

  // One slot stays free for the file about to be opened
  const size_t keepExisting = std::max<size_t>(keepCount, 1) - 1;
  if (sessions.size() <= keepExisting) {
    return 0;
  }

  // Oldest first; names break ties
  std::sort(sessions.begin(), sessions.end());

  size_t removed = 0;
  const size_t toRemove = sessions.size() - keepExisting;
  for (size_t i = 0; i < toRemove; ++i) {
    if (fs::remove(sessions[i].second, ec)) {
      ++removed;
    }
  }
  return removed;
}

} // namespace HexCrawl
